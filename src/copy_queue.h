#ifndef SDIMPORT_COPY_QUEUE_H
#define SDIMPORT_COPY_QUEUE_H

#include "photo_record.h"
#include "path_builder.h"
#include "checksum_validator.h"
#include "print_stream.h"

#include <string>
#include <vector>
#include <map>
#include <set>
#include <filesystem>

#include <cstdint>

namespace sdimport {

//
// Roots of an import. Raw files are staged in the bucket under the
// raw archive and are reorganized from there into dated folders.
//
struct import_roots_t {
   std::filesystem::path source;
   std::filesystem::path raw;
   std::filesystem::path jpg;
   std::filesystem::path backup;

   std::filesystem::path bucket;
};

struct queue_entry_t {
   std::filesystem::path source;

   // full path of the copy, which is the destination directory plus the source file name
   std::filesystem::path target;

   uint64_t size = 0;
};

//
// A copy plan that maps each destination directory to the source
// files that should be copied into it. A source file is queued for
// its type-specific destination (raw staging or jpeg) and always
// for the backup. Files of unknown types are not queued at all.
//
// Checksums of all queued source files are captured when they are
// queued and are used to validate copies and reorganized files.
//
class copy_queue_t {
   public:
      typedef std::map<std::filesystem::path, std::vector<queue_entry_t>> destination_map_t;

   private:
      const import_roots_t& roots;

      std::string raw_extension;
      std::set<std::string> preview_extensions;

      const path_builder_t& path_builder;

      const checksum_validator_t& checksum_validator;

      print_stream_t& print_stream;

      destination_map_t destinations;

      // raw files found at their canonical path with the same content
      std::set<std::filesystem::path> skipped;

      // existing destination file -> source file with the same name and different content
      std::map<std::filesystem::path, std::filesystem::path> mismatched;

      checksum_map_t checksums;

      // staged raw file -> source file
      std::map<std::filesystem::path, std::filesystem::path> staged_sources;

      std::vector<std::filesystem::path> unknown;

   private:
      void append(const std::filesystem::path& destination, const photo_record_t& record);

   public:
      copy_queue_t(const import_roots_t& roots, const std::string& raw_extension, const std::vector<std::string>& preview_extensions, const path_builder_t& path_builder, const checksum_validator_t& checksum_validator, print_stream_t& print_stream);

      // returns the source directory relative to the source root, without a leading DCIM directory
      std::filesystem::path get_subpath(const std::filesystem::path& source) const;

      // returns the source directory relative to the source root
      std::filesystem::path get_backup_subpath(const std::filesystem::path& source) const;

      bool is_raw(const photo_record_t& record) const;

      bool is_preview(const photo_record_t& record) const;

      // throws `std::runtime_error` if a file that is being queued cannot be hashed
      void enqueue(const photo_record_t& record);

      // writes source paths queued for the destination, one per line, and returns the list file path
      std::filesystem::path write(const std::filesystem::path& destination, const std::filesystem::path& list_dir) const;

      const destination_map_t& get_destinations(void) const;

      const std::set<std::filesystem::path>& get_skipped(void) const;

      const std::map<std::filesystem::path, std::filesystem::path>& get_mismatched(void) const;

      const checksum_map_t& get_checksums(void) const;

      // returns captured checksums for files queued for one destination
      checksum_map_t get_checksums(const std::filesystem::path& destination) const;

      const std::map<std::filesystem::path, std::filesystem::path>& get_staged_sources(void) const;

      const std::vector<std::filesystem::path>& get_unknown(void) const;

      uint64_t get_queued_size(const std::filesystem::path& destination) const;

      // returns the plan as a JSON document
      std::string to_json(void) const;
};

}

#endif // SDIMPORT_COPY_QUEUE_H
