#ifndef SDIMPORT_REORGANIZER_H
#define SDIMPORT_REORGANIZER_H

#include "photo_record.h"
#include "path_builder.h"
#include "checksum_validator.h"
#include "import_error.h"
#include "print_stream.h"

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>

#include <cstddef>

namespace sdimport {

//
// Staged (or renamed) file -> final path, which is empty for files
// that could not be placed.
//
typedef std::map<std::filesystem::path, std::optional<std::filesystem::path>> move_map_t;

struct organize_result_t {
   move_map_t moves;

   std::vector<file_error_t> errors;

   // set to false if the staging area could not be walked completely
   bool completed = true;

   size_t count_errors(error_kind_t kind) const;
};

//
// Moves staged raw files into their canonical dated folders. A file
// already present at its canonical path with the same content is
// considered archived and the staged copy is removed. A different
// file with the same name is disambiguated with a ` (n)` suffix.
//
class reorganizer_t {
   private:
      metadata_source_t& metadata_source;

      const checksum_validator_t& checksum_validator;

      size_t path_limit;

      size_t max_name_collisions;

      bool dry_run;

      print_stream_t& print_stream;

   private:
      bool move_file(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error);

      void place_file(const std::filesystem::path& staged_path, const std::filesystem::path& canonical_path, const path_builder_t& path_builder, organize_result_t& result);

   public:
      reorganizer_t(metadata_source_t& metadata_source, const checksum_validator_t& checksum_validator, size_t path_limit, size_t max_name_collisions, bool dry_run, print_stream_t& print_stream);

      organize_result_t organize(const std::filesystem::path& staging_root, const std::filesystem::path& archive_root);

      //
      // Renames archived raw files with names in the older layout, which
      // is `YYYYMMDD-<camera>-<number>-<exposure...>.<ext>`, to the current
      // layout, keeping the sequence number from the old name. Files are
      // renamed within their directories and are never overwritten. Names
      // that do not fit fall back to the short name and a name that is
      // taken gets a ` (n)` suffix. Files under the staging root are left
      // alone.
      //
      organize_result_t migrate_legacy_names(const std::filesystem::path& archive_root, const std::filesystem::path& staging_root, const std::string& raw_extension);
};

}

#endif // SDIMPORT_REORGANIZER_H
