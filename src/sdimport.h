#ifndef SDIMPORT_H
#define SDIMPORT_H

#include <string>
#include <filesystem>
#include <optional>
#include <vector>
#include <chrono>

#include <cstdlib>
#include <cstdint>
#include <cstdio>

namespace sdimport {

struct file_handle_deleter_t {
   void operator () (FILE *file)
   {
      std::fclose(file);
   }
};

//
// Command line options and their values.
//
struct options_t {
   std::optional<std::filesystem::path> source_path;

   std::filesystem::path raw_path;
   std::filesystem::path jpg_path;
   std::filesystem::path backup_path;

   // list files are written into this directory, one per destination
   std::filesystem::path list_dir;

   // raw files are staged in this directory under the raw archive
   std::u8string bucket_name = u8"Import Bucket";

   // lower-case, without a leading period
   std::string raw_extension = "arw";
   std::vector<std::string> preview_extensions = {"jpg", "jpeg"};

   std::string copy_tool = "rsync";

   bool dry_run = false;
   bool assume_yes = false;
   bool list_only = false;
   bool update_legacy_names = false;
   bool print_usage = false;

   size_t max_copy_attempts = 3;
   std::chrono::seconds copy_retry_delay = std::chrono::seconds(1);

   // number of ` (n)` suffixes tried for a name collision
   size_t max_name_collisions = 1000;

   // in bytes of a UTF-8 path
   size_t path_limit = 254;

   size_t mb_hash_max = 8;
   size_t buffer_size = 524288;

   std::u8string log_file;
};

}

#endif // SDIMPORT_H
