#include "copy_queue.h"
#include "import_error.h"
#include "format.h"

#include <rapidjson/rapidjson.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>

#include <fstream>
#include <functional>
#include <stdexcept>
#include <system_error>
#include <algorithm>
#include <cctype>

using namespace std::literals::string_view_literals;

namespace sdimport {

namespace {

void write_json_path(rapidjson::PrettyWriter<rapidjson::StringBuffer>& writer, const std::filesystem::path& path)
{
   std::u8string u8path = path.generic_u8string();

   writer.String(reinterpret_cast<const char*>(u8path.data()), static_cast<rapidjson::SizeType>(u8path.size()));
}

}

copy_queue_t::copy_queue_t(const import_roots_t& roots, const std::string& raw_extension, const std::vector<std::string>& preview_extensions, const path_builder_t& path_builder, const checksum_validator_t& checksum_validator, print_stream_t& print_stream) :
      roots(roots),
      raw_extension(raw_extension),
      preview_extensions(preview_extensions.begin(), preview_extensions.end()),
      path_builder(path_builder),
      checksum_validator(checksum_validator),
      print_stream(print_stream)
{
}

std::filesystem::path copy_queue_t::get_backup_subpath(const std::filesystem::path& source) const
{
   std::filesystem::path subpath = source.parent_path().lexically_relative(roots.source);

   // files in the source root, or outside of it, have no subpath
   if(subpath.empty() || subpath == "." || *subpath.begin() == "..")
      return std::filesystem::path();

   return subpath;
}

std::filesystem::path copy_queue_t::get_subpath(const std::filesystem::path& source) const
{
   std::filesystem::path subpath = get_backup_subpath(source);

   if(subpath.empty())
      return subpath;

   std::string first = subpath.begin()->string();

   std::transform(first.begin(), first.end(), first.begin(), [](unsigned char chr) {return static_cast<char>(std::toupper(chr));});

   // camera folders (e.g. DCIM/100MSDCF) are kept without the DCIM part
   if(first == "DCIM"sv) {
      std::filesystem::path folders;

      for(std::filesystem::path::const_iterator i = std::next(subpath.begin()); i != subpath.end(); ++i)
         folders /= *i;

      return folders;
   }

   return subpath;
}

bool copy_queue_t::is_raw(const photo_record_t& record) const
{
   return record.get_extension() == raw_extension;
}

bool copy_queue_t::is_preview(const photo_record_t& record) const
{
   return preview_extensions.contains(record.get_extension());
}

void copy_queue_t::append(const std::filesystem::path& destination, const photo_record_t& record)
{
   queue_entry_t entry;

   entry.source = record.get_source_path();
   entry.target = destination / record.get_source_path().filename();
   entry.size = std::filesystem::file_size(entry.source);

   std::error_code errcode;

   if(std::filesystem::exists(entry.target, errcode) && !checksum_validator.compare_checksum(entry.target, record.content_hash())) {
      print_stream.warning("{:s} exists and is different from {:s}", entry.target.u8string(), entry.source.u8string());
      mismatched.emplace(entry.target, entry.source);
   }

   destinations[destination].push_back(std::move(entry));
}

void copy_queue_t::enqueue(const photo_record_t& record)
{
   const std::filesystem::path& source = record.get_source_path();

   if(!is_raw(record) && !is_preview(record)) {
      print_stream.warning("Skipping {:s} (unknown file type)", source.u8string());
      unknown.push_back(source);
      return;
   }

   if(checksums.contains(source)) {
      print_stream.warning("{:s} is already queued", source.u8string());
      return;
   }

   // hash the source first, so a file that cannot be read is not queued anywhere
   const std::string& checksum = record.content_hash();

   if(is_raw(record)) {
      bool archived = false;

      try {
         std::filesystem::path canonical_path = path_builder.generate_path(record);

         std::error_code errcode;

         if(std::filesystem::exists(canonical_path, errcode)) {
            if(checksum_validator.compare_checksum(canonical_path, checksum)) {
               print_stream.info("{:s} is already archived as {:s}", source.u8string(), canonical_path.u8string());
               skipped.insert(source);
               archived = true;
            }
            else {
               print_stream.warning("{:s} exists and is different from {:s}", canonical_path.u8string(), source.u8string());
               mismatched.emplace(canonical_path, source);
            }
         }
      }
      catch (const import_error_t& error) {
         // the reorganizer will report this file again after it is staged
         print_stream.warning("Cannot check whether {:s} is archived ({:s})", source.u8string(), error.what());
      }

      if(!archived) {
         std::filesystem::path staging_dir = roots.bucket / get_subpath(source);

         append(staging_dir, record);

         staged_sources.emplace(staging_dir / source.filename(), source);
      }
   }
   else
      append(roots.jpg / get_subpath(source), record);

   append(roots.backup / get_backup_subpath(source), record);

   checksums.emplace(source, checksum);
}

std::filesystem::path copy_queue_t::write(const std::filesystem::path& destination, const std::filesystem::path& list_dir) const
{
   destination_map_t::const_iterator entries = destinations.find(destination);

   if(entries == destinations.end())
      throw std::runtime_error(FMTNS::format("Nothing is queued for {:s}"sv, destination.u8string()));

   std::filesystem::create_directories(list_dir);

   // same destination always maps to the same list file, which is overwritten
   std::filesystem::path list_path = list_dir / FMTNS::format("{:016x}.lst"sv, std::hash<std::u8string>{}(destination.generic_u8string()));

   std::ofstream list_file(list_path, std::ios::binary | std::ios::trunc);

   if(!list_file)
      throw std::runtime_error(FMTNS::format("Cannot open list file {:s}"sv, list_path.u8string()));

   for(const queue_entry_t& entry : entries->second) {
      std::u8string source = std::filesystem::absolute(entry.source).u8string();

      list_file.write(reinterpret_cast<const char*>(source.data()), source.size());
      list_file.put('\n');
   }

   list_file.close();

   if(!list_file)
      throw std::runtime_error(FMTNS::format("Cannot write list file {:s}"sv, list_path.u8string()));

   return list_path;
}

const copy_queue_t::destination_map_t& copy_queue_t::get_destinations(void) const
{
   return destinations;
}

const std::set<std::filesystem::path>& copy_queue_t::get_skipped(void) const
{
   return skipped;
}

const std::map<std::filesystem::path, std::filesystem::path>& copy_queue_t::get_mismatched(void) const
{
   return mismatched;
}

const checksum_map_t& copy_queue_t::get_checksums(void) const
{
   return checksums;
}

checksum_map_t copy_queue_t::get_checksums(const std::filesystem::path& destination) const
{
   checksum_map_t destination_checksums;

   destination_map_t::const_iterator entries = destinations.find(destination);

   if(entries != destinations.end()) {
      for(const queue_entry_t& entry : entries->second)
         destination_checksums.emplace(entry.source, checksums.at(entry.source));
   }

   return destination_checksums;
}

const std::map<std::filesystem::path, std::filesystem::path>& copy_queue_t::get_staged_sources(void) const
{
   return staged_sources;
}

const std::vector<std::filesystem::path>& copy_queue_t::get_unknown(void) const
{
   return unknown;
}

uint64_t copy_queue_t::get_queued_size(const std::filesystem::path& destination) const
{
   uint64_t size = 0;

   destination_map_t::const_iterator entries = destinations.find(destination);

   if(entries != destinations.end()) {
      for(const queue_entry_t& entry : entries->second)
         size += entry.size;
   }

   return size;
}

std::string copy_queue_t::to_json(void) const
{
   rapidjson::StringBuffer buffer;
   rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

   writer.StartObject();

   writer.Key("destinations");
   writer.StartArray();

   for(const destination_map_t::value_type& destination : destinations) {
      uint64_t size = get_queued_size(destination.first);

      writer.StartObject();
      writer.Key("path");
      write_json_path(writer, destination.first);
      writer.Key("files");
      writer.Uint64(destination.second.size());
      writer.Key("size");
      writer.Uint64(size);
      writer.Key("hr_size");
      writer.String(hr_bytes(size).c_str());

      writer.Key("sources");
      writer.StartArray();
      for(const queue_entry_t& entry : destination.second)
         write_json_path(writer, entry.source);
      writer.EndArray();

      writer.EndObject();
   }

   writer.EndArray();

   writer.Key("skipped");
   writer.StartArray();
   for(const std::filesystem::path& source : skipped)
      write_json_path(writer, source);
   writer.EndArray();

   writer.Key("mismatched");
   writer.StartArray();
   for(const std::map<std::filesystem::path, std::filesystem::path>::value_type& entry : mismatched) {
      writer.StartObject();
      writer.Key("destination");
      write_json_path(writer, entry.first);
      writer.Key("source");
      write_json_path(writer, entry.second);
      writer.EndObject();
   }
   writer.EndArray();

   writer.Key("unknown");
   writer.StartArray();
   for(const std::filesystem::path& source : unknown)
      write_json_path(writer, source);
   writer.EndArray();

   writer.EndObject();

   return std::string(buffer.GetString(), buffer.GetSize());
}

}
