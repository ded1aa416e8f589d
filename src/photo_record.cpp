#include "photo_record.h"

#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace sdimport {

photo_record_t::photo_record_t(const std::filesystem::path& source_path, photo_attributes_t&& attributes, const file_hasher_t& file_hasher) :
      source_path(source_path),
      extension(parse_extension(source_path)),
      attributes(std::move(attributes)),
      file_hasher(file_hasher)
{
   if(this->attributes.sequence_number.empty())
      this->attributes.sequence_number = parse_sequence_number(source_path);
}

std::string photo_record_t::parse_extension(const std::filesystem::path& filepath)
{
   std::string ext = filepath.extension().string();

   if(!ext.empty() && ext.front() == '.')
      ext.erase(0, 1);

   std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char chr) {return static_cast<char>(std::tolower(chr));});

   return ext;
}

std::string photo_record_t::parse_sequence_number(const std::filesystem::path& filepath)
{
   std::string stem = filepath.stem().string();

   std::string::size_type pos = stem.size();

   while(pos > 0 && std::isdigit(static_cast<unsigned char>(stem[pos-1])))
      pos--;

   if(pos == stem.size())
      return "unknown";

   return stem.substr(pos);
}

const std::filesystem::path& photo_record_t::get_source_path(void) const
{
   return source_path;
}

const std::string& photo_record_t::get_extension(void) const
{
   return extension;
}

const photo_attributes_t& photo_record_t::get_attributes(void) const
{
   return attributes;
}

const std::string& photo_record_t::content_hash(void) const
{
   std::call_once(hash_once, [this] () {
      try {
         hash_result.digest = file_hasher.hash_file(source_path);
      }
      catch (const std::exception& error) {
         // a failed hash is cached as well, so the file is not read again
         hash_result.error = error.what();
      }
   });

   if(!hash_result.digest.has_value())
      throw std::runtime_error(hash_result.error);

   return hash_result.digest.value();
}

bool photo_record_t::prime_content_hash(hash_result_t&& result) const
{
   bool primed = false;

   std::call_once(hash_once, [this, &result, &primed] () {
      hash_result = std::move(result);
      primed = true;
   });

   return primed;
}

}
