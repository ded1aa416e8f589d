//
// SD Card Photo Import (sdimport)
// 
// Copyright (c) 2026, Stone Steps Inc.
//
#include "import_workflow.h"
#include "reorganizer.h"
#include "exif_reader.h"
#include "volume_locator.h"
#include "operator_prompt.h"
#include "command_runner.h"
#include "file_hasher.h"
#include "print_stream.h"
#include "format.h"

#include "sdimport.h"

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <cctype>

#include <string>
#include <stdexcept>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <optional>
#include <memory>

using namespace std::literals::string_view_literals;
using namespace std::literals::string_literals;

//
// Build number is used only when the project is being built in a
// CI pipeline, where build numbers are maintained.
//
#ifndef BUILD_NUMBER
#define BUILD_NUMBER 0
#endif

#define STR_BUILD_NUMBER2(v) #v
#define STR_BUILD_NUMBER(v) STR_BUILD_NUMBER2(v)

namespace sdimport {

static const char *title = "SD Card Photo Import";
static const char *version = "1.0.0+" STR_BUILD_NUMBER(BUILD_NUMBER);
static const char *copyright = "Copyright (c) 2026 Stone Steps Inc.";

void print_usage(void)
{
   printf("%s (sdimport) %s -- %s\n", title, version, copyright);

   fputs("\nUsage: sdimport [options]\n\n", stdout);

   fputs("    -s path      - photo volume (default: first volume with DCIM under /media)\n", stdout);
   fputs("    -r path      - raw file archive\n", stdout);
   fputs("    -j path      - jpeg archive\n", stdout);
   fputs("    -b path      - backup directory\n", stdout);
   fputs("    -e ext       - raw file extension (default: arw)\n", stdout);
   fputs("    -p ext,...   - preview file extensions (default: jpg,jpeg)\n", stdout);
   fputs("    -n           - dry run\n", stdout);
   fputs("    -y           - continue after failures without asking\n", stdout);
   fputs("    -L           - write list files and print the copy plan, without copying\n", stdout);
   fputs("    -U           - rename archived raw files with legacy names\n", stdout);
   fputs("    -R number    - copy attempts (default: 3, min: 1, max: 100)\n", stdout);
   fputs("    -D seconds   - delay between copy attempts (default: 1)\n", stdout);
   fputs("    -C number    - alternative names tried for a name collision (default: 1000)\n", stdout);
   fputs("    -P number    - path length limit, in bytes (default: 254)\n", stdout);
   fputs("    -H number    - multi-buffer hash maximum (default: 8, min: 1, max: 32)\n", stdout);
   fputs("    -S size      - file buffer size (default: 524288, min: 512, max: 16777216)\n", stdout);
   fputs("    -T path      - list file directory (default: system temporary directory)\n", stdout);
   fputs("    -c program   - rsync-compatible copy program, or cp to copy one file at a time (default: rsync)\n", stdout);
   fputs("    -l path      - log file path\n", stdout);
   fputs("    -?           - this help\n", stdout);

   fputc('\n', stdout);
}

// returns a lower-case extension without a leading period
static std::string normalize_extension(std::string_view ext)
{
   if(!ext.empty() && ext.front() == '.')
      ext.remove_prefix(1);

   std::string normalized(ext);

   std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char chr) {return static_cast<char>(std::tolower(chr));});

   return normalized;
}

static std::vector<std::string> parse_extensions(std::string_view exts)
{
   std::vector<std::string> extensions;

   while(!exts.empty()) {
      std::string_view::size_type comma = exts.find(',');

      std::string ext = normalize_extension(exts.substr(0, comma));

      if(!ext.empty())
         extensions.push_back(std::move(ext));

      if(comma == std::string_view::npos)
         break;

      exts.remove_prefix(comma + 1);
   }

   return extensions;
}

options_t parse_options(int argc, char *argv[])
{
   options_t options;

   // start with 1 to skip the command program name
   for(int i = 1; i < argc; i++) {
      if(!argv[i])
         throw std::runtime_error(FMTNS::format("A null argument is not valid: {:d}", i));

      if(*argv[i] != '-')
         throw std::runtime_error(FMTNS::format("Invalid option: {:s}", argv[i]));

      if(*(argv[i]+1) == '-') {
         if(!strcmp(argv[i]+2, "help"))
            options.print_usage = true;
         else
            throw std::runtime_error(FMTNS::format("Invalid long option {:s}", argv[i]));

         continue;
      }

      // all options with values have values that don't start with a dash
      bool has_value = i+1 < argc && *(argv[i+1]) != '-';

      switch(*(argv[i]+1)) {
         case 's':
            if(!has_value)
               throw std::runtime_error("Missing photo volume path value");

            options.source_path = std::filesystem::path(reinterpret_cast<const char8_t*>(argv[++i]));
            break;
         case 'r':
            if(!has_value)
               throw std::runtime_error("Missing raw archive path value");

            options.raw_path = std::filesystem::path(reinterpret_cast<const char8_t*>(argv[++i]));
            break;
         case 'j':
            if(!has_value)
               throw std::runtime_error("Missing jpeg archive path value");

            options.jpg_path = std::filesystem::path(reinterpret_cast<const char8_t*>(argv[++i]));
            break;
         case 'b':
            if(!has_value)
               throw std::runtime_error("Missing backup path value");

            options.backup_path = std::filesystem::path(reinterpret_cast<const char8_t*>(argv[++i]));
            break;
         case 'e':
            if(!has_value)
               throw std::runtime_error("Missing raw file extension value");

            options.raw_extension = normalize_extension(argv[++i]);
            break;
         case 'p':
            if(!has_value)
               throw std::runtime_error("Missing preview file extensions value");

            options.preview_extensions = parse_extensions(argv[++i]);
            break;
         case 'n':
            options.dry_run = true;
            break;
         case 'y':
            options.assume_yes = true;
            break;
         case 'L':
            options.list_only = true;
            break;
         case 'U':
            options.update_legacy_names = true;
            break;
         case 'R':
            if(!has_value)
               throw std::runtime_error("Missing copy attempts value");

            options.max_copy_attempts = atoi(argv[++i]);
            break;
         case 'D':
            if(!has_value)
               throw std::runtime_error("Missing copy retry delay value");

            options.copy_retry_delay = std::chrono::seconds(atoi(argv[++i]));
            break;
         case 'C':
            if(!has_value)
               throw std::runtime_error("Missing name collision maximum value");

            options.max_name_collisions = atoi(argv[++i]);
            break;
         case 'P':
            if(!has_value)
               throw std::runtime_error("Missing path length limit value");

            options.path_limit = atoi(argv[++i]);
            break;
         case 'H':
            if(!has_value)
               throw std::runtime_error("Missing multi-buffer hash maximum value");

            options.mb_hash_max = atoi(argv[++i]);
            break;
         case 'S':
            if(!has_value)
               throw std::runtime_error("Missing buffer size value");

            options.buffer_size = atoi(argv[++i]);
            break;
         case 'T':
            if(!has_value)
               throw std::runtime_error("Missing list file directory value");

            options.list_dir = std::filesystem::path(reinterpret_cast<const char8_t*>(argv[++i]));
            break;
         case 'c':
            if(!has_value)
               throw std::runtime_error("Missing copy program value");

            options.copy_tool = argv[++i];
            break;
         case 'l':
            if(!has_value)
               throw std::runtime_error("Missing log file path value");

            options.log_file = reinterpret_cast<const char8_t*>(argv[++i]);
            break;
         case 'h':
         case '?':
            options.print_usage = true;
            break;
         default:
            throw std::runtime_error(FMTNS::format("Unknown option: {:s}", argv[i]));
      }
   }

   return options;
}

void verify_options(options_t& options)
{
   if(options.raw_path.empty())
      throw std::runtime_error("Raw archive path must be specified");

   // other destinations are not used when renaming archived files
   if(!options.update_legacy_names) {
      if(options.jpg_path.empty())
         throw std::runtime_error("Jpeg archive path must be specified");

      if(options.backup_path.empty())
         throw std::runtime_error("Backup path must be specified");
   }

   if(options.raw_extension.empty() || !std::all_of(options.raw_extension.begin(), options.raw_extension.end(), [](unsigned char chr) {return std::isalnum(chr);}))
      throw std::runtime_error(FMTNS::format("Invalid raw file extension: {:s}", options.raw_extension));

   if(std::find(options.preview_extensions.begin(), options.preview_extensions.end(), options.raw_extension) != options.preview_extensions.end())
      throw std::runtime_error("Raw file extension cannot be a preview file extension");

   if(options.max_copy_attempts == 0 || options.max_copy_attempts > 100)
      throw std::runtime_error("Invalid number of copy attempts");

   if(options.copy_retry_delay.count() < 0)
      throw std::runtime_error("Invalid copy retry delay");

   if(options.max_name_collisions == 0)
      throw std::runtime_error("Invalid name collision maximum");

   if(options.path_limit < 64 || options.path_limit > 4096)
      throw std::runtime_error("Invalid path length limit");

   if(options.mb_hash_max == 0 || options.mb_hash_max > 32)
      throw std::runtime_error("Invalid multi-buffer hash maximum");

   if(options.buffer_size < 512 || options.buffer_size > 16*1024*1024)
      throw std::runtime_error("Invalid file buffer size");

   if(options.copy_tool.empty())
      throw std::runtime_error("Copy program cannot be empty");

   if(options.list_dir.empty())
      options.list_dir = std::filesystem::temp_directory_path() / "sdimport";

   // list files contain absolute paths and rsync resolves them against the root
   if(options.source_path.has_value())
      options.source_path = std::filesystem::absolute(options.source_path.value());

   options.raw_path = std::filesystem::absolute(options.raw_path);

   if(!options.jpg_path.empty())
      options.jpg_path = std::filesystem::absolute(options.jpg_path);

   if(!options.backup_path.empty())
      options.backup_path = std::filesystem::absolute(options.backup_path);
}

int update_legacy_names(const options_t& options, metadata_source_t& metadata_source, const file_hasher_t& file_hasher, print_stream_t& print_stream)
{
   checksum_validator_t checksum_validator(file_hasher, print_stream);

   reorganizer_t reorganizer(metadata_source, checksum_validator, options.path_limit, options.max_name_collisions, options.dry_run, print_stream);

   organize_result_t result = reorganizer.migrate_legacy_names(options.raw_path, options.raw_path / options.bucket_name, options.raw_extension);

   print_stream.info("Renamed {:d} files with {:d} errors", std::count_if(result.moves.begin(), result.moves.end(), [](const move_map_t::value_type& move) {return move.second.has_value();}), result.errors.size());

   return result.completed && result.errors.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int list_import(const options_t& options, const import_roots_t& roots, import_workflow_t& import_workflow, const file_hasher_t& file_hasher, print_stream_t& print_stream)
{
   import_workflow_t::validate_roots(roots);

   path_builder_t path_builder(roots.raw, options.path_limit);
   checksum_validator_t checksum_validator(file_hasher, print_stream);

   std::unique_ptr<copy_queue_t> copy_queue = import_workflow.build_queue(roots, path_builder, checksum_validator);

   for(const copy_queue_t::destination_map_t::value_type& destination : copy_queue->get_destinations())
      print_stream.info("Wrote {:s} for {:s}", copy_queue->write(destination.first, options.list_dir).u8string(), destination.first.u8string());

   std::cout << copy_queue->to_json() << '\n';

   return import_workflow.get_errors().empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}

}

int main(int argc, char *argv[])
{
   try {
      sdimport::options_t options = sdimport::parse_options(argc, argv);

      if(options.print_usage) {
         sdimport::print_usage();
         return EXIT_SUCCESS;
      }

      sdimport::verify_options(options);

      printf("%s (sdimport) %s -- %s\n\n", sdimport::title, sdimport::version, sdimport::copyright);

      //
      // Open a print stream
      //
      std::ofstream log_stream;

      if(!options.log_file.empty()) {
         // open the log file in binary mode, where supported, so character encoding is preserved
         log_stream.open(std::filesystem::path(options.log_file), std::ios::app | std::ios::binary);

         if(!log_stream.is_open())
            throw std::runtime_error(FMTNS::format("Cannot open log file {:s}", options.log_file));
      }

      sdimport::print_stream_t print_stream(std::move(log_stream));

      sdimport::file_hasher_t file_hasher(options.buffer_size, options.mb_hash_max);

      std::vector<std::string> exif_exts = options.preview_extensions;
      exif_exts.push_back(options.raw_extension);

      //
      // Initialize underlying libraries before any of the components
      // are created.
      //
      sdimport::exif::exif_reader_t::initialize(print_stream);

      int exit_code = EXIT_FAILURE;

      try {
         sdimport::exif::exif_reader_t exif_reader(exif_exts, file_hasher, print_stream);

         if(options.update_legacy_names)
            exit_code = sdimport::update_legacy_names(options, exif_reader, file_hasher, print_stream);
         else {
            std::optional<std::filesystem::path> source_path = options.source_path;

            if(!source_path.has_value()) {
               sdimport::media_volume_locator_t volume_locator(sdimport::media_volume_locator_t::default_media_dirs(), print_stream);

               if(!(source_path = volume_locator.find_volume()).has_value())
                  throw std::runtime_error("Cannot find a photo volume (use -s to specify one)");
            }

            sdimport::import_roots_t roots = sdimport::import_workflow_t::make_roots(options, source_path.value());

            sdimport::process_runner_t process_runner;

            std::unique_ptr<sdimport::operator_prompt_t> operator_prompt;

            if(options.assume_yes)
               operator_prompt = std::make_unique<sdimport::auto_prompt_t>(true);
            else
               operator_prompt = std::make_unique<sdimport::console_prompt_t>(std::cin, std::cout);

            sdimport::import_workflow_t import_workflow(options, file_hasher, exif_reader, process_runner, *operator_prompt, print_stream);

            if(options.list_only)
               exit_code = sdimport::list_import(options, roots, import_workflow, file_hasher, print_stream);
            else {
               print_stream.info("Importing {:s}{:s}", roots.source.u8string(), options.dry_run ? " (dry run)" : "");

               sdimport::workflow_result_t result = import_workflow.run(roots);

               exit_code = result.state == sdimport::workflow_state_t::done ? EXIT_SUCCESS : EXIT_FAILURE;
            }
         }
      }
      catch (...) {
         sdimport::exif::exif_reader_t::cleanup(print_stream);
         throw;
      }

      sdimport::exif::exif_reader_t::cleanup(print_stream);

      return exit_code;
   }
   catch (const std::exception& error) {
      fprintf(stderr, "ERROR: %s\n", error.what());
   }

   return EXIT_FAILURE;
}
