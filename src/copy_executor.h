#ifndef SDIMPORT_COPY_EXECUTOR_H
#define SDIMPORT_COPY_EXECUTOR_H

#include "command_runner.h"
#include "print_stream.h"

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <chrono>

#include <cstddef>

namespace sdimport {

//
// Builds command lines for an external copy program. A backend may
// support copying a directory or a single file, copying files named
// in a list file, or both. A directory source has its contents copied
// into the destination directory and a file source is copied to the
// destination path.
//
class copy_backend_t {
   public:
      virtual ~copy_backend_t(void) = default;

      virtual const char *name(void) const = 0;

      virtual bool supports_list_copy(void) const = 0;

      virtual std::vector<std::string> copy_command(const std::filesystem::path& source_root, const std::filesystem::path& destination_root) const = 0;

      // throws `import_error_t` with `unsupported_operation` if list copies are not supported
      virtual std::vector<std::string> list_copy_command(const std::filesystem::path& list_path, const std::filesystem::path& destination_root) const = 0;
};

//
// Copies with `cp`, which cannot copy from a list. Existing files are
// not overwritten.
//
class local_bulk_copy_t : public copy_backend_t {
   public:
      const char *name(void) const override;

      bool supports_list_copy(void) const override;

      std::vector<std::string> copy_command(const std::filesystem::path& source_root, const std::filesystem::path& destination_root) const override;

      std::vector<std::string> list_copy_command(const std::filesystem::path& list_path, const std::filesystem::path& destination_root) const override;
};

//
// Copies with `rsync`, comparing content with checksums. Listed files
// are copied flat into the destination and existing files are left
// alone, so they are caught by the checksum validation instead of
// being overwritten.
//
class list_bulk_copy_t : public copy_backend_t {
   private:
      std::string program;

   public:
      list_bulk_copy_t(const std::string& program);

      const char *name(void) const override;

      bool supports_list_copy(void) const override;

      std::vector<std::string> copy_command(const std::filesystem::path& source_root, const std::filesystem::path& destination_root) const override;

      std::vector<std::string> list_copy_command(const std::filesystem::path& list_path, const std::filesystem::path& destination_root) const override;
};

// returns a `cp` backend if the program is `cp` and a list backend otherwise
std::unique_ptr<copy_backend_t> make_copy_backend(const std::string& program);

struct retry_policy_t {
   size_t max_attempts = 3;

   std::chrono::milliseconds delay = std::chrono::seconds(1);
};

//
// Runs copy commands for one destination at a time, retrying failed
// commands. In a dry run, commands are only logged. A copy that failed on every attempt is reported with a
// `false` return value and the caller decides whether to continue.
//
class copy_executor_t {
   private:
      const copy_backend_t& backend;

      command_runner_t& command_runner;

      retry_policy_t retry_policy;

      bool dry_run;

      print_stream_t& print_stream;

   private:
      bool run_with_retries(const std::vector<std::string>& command, const std::filesystem::path& destination_root);

   public:
      copy_executor_t(const copy_backend_t& backend, command_runner_t& command_runner, const retry_policy_t& retry_policy, bool dry_run, print_stream_t& print_stream);

      bool copy(const std::filesystem::path& source_root, const std::filesystem::path& destination_root);

      // throws `import_error_t` if the list file does not exist or in a dry run
      bool copy_from_list(const std::filesystem::path& list_path, const std::filesystem::path& destination_root);
};

}

#endif // SDIMPORT_COPY_EXECUTOR_H
