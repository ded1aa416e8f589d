#include "reorganizer.h"
#include "file_tree_walker.h"
#include "format.h"

#include <regex>
#include <algorithm>
#include <system_error>

using namespace std::literals::string_view_literals;

namespace sdimport {

size_t organize_result_t::count_errors(error_kind_t kind) const
{
   return std::count_if(errors.begin(), errors.end(), [kind] (const file_error_t& error) {return error.kind == kind;});
}

reorganizer_t::reorganizer_t(metadata_source_t& metadata_source, const checksum_validator_t& checksum_validator, size_t path_limit, size_t max_name_collisions, bool dry_run, print_stream_t& print_stream) :
      metadata_source(metadata_source),
      checksum_validator(checksum_validator),
      path_limit(path_limit),
      max_name_collisions(max_name_collisions),
      dry_run(dry_run),
      print_stream(print_stream)
{
}

//
// Staged files are normally on the same volume as the archive and are
// just renamed. If they are not, the file is copied and the original
// is removed once the copy is complete.
//
bool reorganizer_t::move_file(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error)
{
   std::error_code errcode;

   std::filesystem::rename(from, to, errcode);

   if(!errcode)
      return true;

   if(errcode != std::errc::cross_device_link) {
      error = errcode.message();
      return false;
   }

   if(!std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, errcode)) {
      error = errcode ? errcode.message() : "destination exists";
      return false;
   }

   if(!std::filesystem::remove(from, errcode)) {
      // the file was placed, but there is now a stray copy in the staging area
      print_stream.warning("Cannot remove {:s} after copying it to {:s} ({:s})", from.u8string(), to.u8string(), errcode.message());
   }

   return true;
}

void reorganizer_t::place_file(const std::filesystem::path& staged_path, const std::filesystem::path& canonical_path, const path_builder_t& path_builder, organize_result_t& result)
{
   std::error_code errcode;

   if(!dry_run) {
      std::filesystem::create_directories(canonical_path.parent_path(), errcode);

      if(errcode) {
         std::string message = FMTNS::format("Cannot create {:s} ({:s})"sv, canonical_path.parent_path().u8string(), errcode.message());

         print_stream.error("{:s} for {:s}", message, staged_path.u8string());
         result.moves.emplace(staged_path, std::nullopt);
         result.errors.push_back({error_kind_t::not_writable, staged_path, canonical_path, std::move(message)});
         return;
      }
   }

   std::filesystem::path target_path = canonical_path;

   for(size_t n = 0; ; n++) {
      if(n > max_name_collisions) {
         std::string message = FMTNS::format("All {:d} alternative names for {:s} are taken"sv, max_name_collisions, canonical_path.u8string());

         print_stream.error("{:s} ({:s} stays in place)", message, staged_path.u8string());
         result.moves.emplace(staged_path, std::nullopt);
         result.errors.push_back({error_kind_t::name_collision_unresolved, staged_path, canonical_path, std::move(message)});
         return;
      }

      if(n) {
         try {
            target_path = path_builder.disambiguate(canonical_path, n);
         }
         catch (const import_error_t& error) {
            print_stream.error("{:s}", error.what());
            result.moves.emplace(staged_path, std::nullopt);
            result.errors.push_back({error.get_kind(), staged_path, canonical_path, error.what()});
            return;
         }
      }

      if(!std::filesystem::exists(target_path, errcode))
         break;

      // same content under this name means the file was archived in an earlier import
      if(checksum_validator.compare_checksums(staged_path, target_path)) {
         result.moves.emplace(staged_path, target_path);

         if(dry_run)
            print_stream.info("Would remove {:s} (archived as {:s})", staged_path.u8string(), target_path.u8string());
         else {
            print_stream.info("Removing {:s} (archived as {:s})", staged_path.u8string(), target_path.u8string());

            if(!std::filesystem::remove(staged_path, errcode))
               print_stream.warning("Cannot remove {:s} ({:s})", staged_path.u8string(), errcode.message());
         }

         return;
      }

      if(!n)
         print_stream.warning("{:s} exists and is different from {:s}", target_path.u8string(), staged_path.u8string());
   }

   if(dry_run) {
      print_stream.info("Would move {:s} to {:s}", staged_path.u8string(), target_path.u8string());
      result.moves.emplace(staged_path, target_path);
      return;
   }

   std::string error;

   if(!move_file(staged_path, target_path, error)) {
      std::string message = FMTNS::format("Cannot move {:s} to {:s} ({:s})"sv, staged_path.u8string(), target_path.u8string(), error);

      print_stream.error("{:s}", message);
      result.moves.emplace(staged_path, std::nullopt);
      result.errors.push_back({error_kind_t::not_writable, staged_path, target_path, std::move(message)});
      return;
   }

   print_stream.info("Moved {:s} to {:s}", staged_path.u8string(), target_path.u8string());

   result.moves.emplace(staged_path, target_path);
}

organize_result_t reorganizer_t::organize(const std::filesystem::path& staging_root, const std::filesystem::path& archive_root)
{
   organize_result_t result;

   std::error_code errcode;

   if(!std::filesystem::is_directory(staging_root, errcode))
      throw import_error_t(error_kind_t::path_not_found, FMTNS::format("Staging directory {:s} does not exist"sv, staging_root.u8string()));

   path_builder_t path_builder(archive_root, path_limit);

   file_tree_walker_t file_tree_walker(print_stream);

   std::vector<std::filesystem::path> staged_files = file_tree_walker.walk_tree<std::filesystem::recursive_directory_iterator>(staging_root);

   result.completed = file_tree_walker.was_walk_completed();

   print_stream.info("Organizing {:d} files ({:s}) from {:s}", staged_files.size(), hr_bytes(file_tree_walker.get_found_size()), staging_root.u8string());

   for(const std::filesystem::path& staged_path : staged_files) {
      photo_record_ptr_t record = metadata_source.read_record(staged_path);

      std::filesystem::path canonical_path;

      try {
         canonical_path = path_builder.generate_path(*record);
      }
      catch (const import_error_t& error) {
         print_stream.error("Cannot place {:s} ({:s})", staged_path.u8string(), error.what());
         result.moves.emplace(staged_path, std::nullopt);
         result.errors.push_back({error.get_kind(), staged_path, std::filesystem::path(), error.what()});
         continue;
      }

      place_file(staged_path, canonical_path, path_builder, result);
   }

   return result;
}

organize_result_t reorganizer_t::migrate_legacy_names(const std::filesystem::path& archive_root, const std::filesystem::path& staging_root, const std::string& raw_extension)
{
   organize_result_t result;

   std::error_code errcode;

   if(!std::filesystem::is_directory(archive_root, errcode))
      throw import_error_t(error_kind_t::path_not_found, FMTNS::format("Archive directory {:s} does not exist"sv, archive_root.u8string()));

   // e.g. 20230805-ILCE7RM4-01234-m2.7EB.arw, where the number is captured
   std::regex legacy_name(FMTNS::format(R"(^\d{{8}}-\w+-(\d{{3,}}|unknown)-.+\.{:s}$)"sv, raw_extension), std::regex::ECMAScript | std::regex::icase);

   path_builder_t path_builder(archive_root, path_limit);

   file_tree_walker_t file_tree_walker(print_stream);

   std::vector<std::filesystem::path> archived_files = file_tree_walker.walk_tree<std::filesystem::recursive_directory_iterator>(archive_root);

   result.completed = file_tree_walker.was_walk_completed();

   for(const std::filesystem::path& filepath : archived_files) {
      // staged files are named when they are organized
      if(!staging_root.empty()) {
         std::filesystem::path staged_subpath = filepath.lexically_relative(staging_root);

         if(!staged_subpath.empty() && *staged_subpath.begin() != "..")
            continue;
      }

      std::string filename = filepath.filename().string();

      std::smatch match;

      if(!std::regex_match(filename, match, legacy_name))
         continue;

      photo_record_ptr_t record = metadata_source.read_record(filepath);

      name_overrides_t overrides;
      overrides.sequence_number = match[1].str();

      std::filesystem::path new_path;

      try {
         std::filesystem::path canonical_path = path_builder.generate_path_in(filepath.parent_path(), *record, overrides);

         new_path = canonical_path;

         for(size_t n = 1; std::filesystem::exists(new_path, errcode); n++) {
            if(n > max_name_collisions) {
               std::string message = FMTNS::format("All {:d} alternative names for {:s} are taken"sv, max_name_collisions, canonical_path.u8string());

               print_stream.error("Not renaming {:s} ({:s})", filepath.u8string(), message);
               result.errors.push_back({error_kind_t::name_collision_unresolved, filepath, canonical_path, std::move(message)});
               new_path.clear();
               break;
            }

            new_path = path_builder.disambiguate(canonical_path, n);
         }
      }
      catch (const import_error_t& error) {
         print_stream.error("Cannot rename {:s} ({:s})", filepath.u8string(), error.what());
         result.moves.emplace(filepath, std::nullopt);
         result.errors.push_back({error.get_kind(), filepath, std::filesystem::path(), error.what()});
         continue;
      }

      if(new_path.empty()) {
         result.moves.emplace(filepath, std::nullopt);
         continue;
      }

      if(dry_run) {
         print_stream.info("Would rename {:s} to {:s}", filepath.u8string(), new_path.u8string());
         result.moves.emplace(filepath, new_path);
         continue;
      }

      std::string error;

      if(!move_file(filepath, new_path, error)) {
         std::string message = FMTNS::format("Cannot rename {:s} to {:s} ({:s})"sv, filepath.u8string(), new_path.u8string(), error);

         print_stream.error("{:s}", message);
         result.moves.emplace(filepath, std::nullopt);
         result.errors.push_back({error_kind_t::not_writable, filepath, new_path, std::move(message)});
         continue;
      }

      print_stream.info("Renamed {:s} to {:s}", filepath.u8string(), new_path.u8string());

      result.moves.emplace(filepath, new_path);
   }

   return result;
}

}
