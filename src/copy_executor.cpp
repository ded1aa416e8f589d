#include "copy_executor.h"
#include "import_error.h"
#include "format.h"

#include <thread>
#include <system_error>
#include <algorithm>
#include <iterator>

using namespace std::literals::string_view_literals;

namespace sdimport {

namespace {

std::string join_command(const std::vector<std::string>& command)
{
   std::string line;

   for(const std::string& arg : command) {
      if(!line.empty())
         line += ' ';

      if(arg.find(' ') != std::string::npos)
         FMTNS::format_to(std::back_inserter(line), "\"{:s}\""sv, arg);
      else
         line += arg;
   }

   return line;
}

// a trailing separator makes rsync copy the contents of a directory rather than the directory itself
std::string dir_contents(const std::filesystem::path& dir)
{
   std::string path = dir.string();

   if(path.empty() || path.back() != '/')
      path += '/';

   return path;
}

}

const char *local_bulk_copy_t::name(void) const
{
   return "cp";
}

bool local_bulk_copy_t::supports_list_copy(void) const
{
   return false;
}

std::vector<std::string> local_bulk_copy_t::copy_command(const std::filesystem::path& source_root, const std::filesystem::path& destination_root) const
{
   // -T treats the destination as the copy itself, for directories and files alike
   return {"cp", "-a", "-n", "-T", source_root.string(), destination_root.string()};
}

std::vector<std::string> local_bulk_copy_t::list_copy_command(const std::filesystem::path& list_path, const std::filesystem::path& destination_root) const
{
   throw import_error_t(error_kind_t::unsupported_operation, FMTNS::format("{:s} cannot copy files listed in {:s}"sv, name(), list_path.u8string()));
}

list_bulk_copy_t::list_bulk_copy_t(const std::string& program) :
      program(program)
{
}

const char *list_bulk_copy_t::name(void) const
{
   return program.c_str();
}

bool list_bulk_copy_t::supports_list_copy(void) const
{
   return true;
}

std::vector<std::string> list_bulk_copy_t::copy_command(const std::filesystem::path& source_root, const std::filesystem::path& destination_root) const
{
   std::error_code errcode;

   if(!std::filesystem::is_directory(source_root, errcode))
      return {program, "-a", "--checksum", "--ignore-existing", source_root.string(), destination_root.string()};

   return {program, "-a", "--checksum", dir_contents(source_root), dir_contents(destination_root)};
}

std::vector<std::string> list_bulk_copy_t::list_copy_command(const std::filesystem::path& list_path, const std::filesystem::path& destination_root) const
{
   // listed paths are absolute, so they are resolved against the file system root
   return {program, "-a", "--checksum", "--ignore-existing", "--no-relative", "--files-from=" + list_path.string(), "/", dir_contents(destination_root)};
}

std::unique_ptr<copy_backend_t> make_copy_backend(const std::string& program)
{
   if(std::filesystem::path(program).filename() == "cp")
      return std::make_unique<local_bulk_copy_t>();

   return std::make_unique<list_bulk_copy_t>(program);
}

copy_executor_t::copy_executor_t(const copy_backend_t& backend, command_runner_t& command_runner, const retry_policy_t& retry_policy, bool dry_run, print_stream_t& print_stream) :
      backend(backend),
      command_runner(command_runner),
      retry_policy(retry_policy),
      dry_run(dry_run),
      print_stream(print_stream)
{
}

bool copy_executor_t::run_with_retries(const std::vector<std::string>& command, const std::filesystem::path& destination_root)
{
   std::string command_line = join_command(command);

   size_t max_attempts = std::max(retry_policy.max_attempts, static_cast<size_t>(1));

   for(size_t attempt = 1; attempt <= max_attempts; attempt++) {
      try {
         int status = command_runner.run(command);

         if(status == 0)
            return true;

         print_stream.warning("{:s} exited with status {:d} (attempt {:d} of {:d})", command_line, status, attempt, max_attempts);
      }
      catch (const std::exception& error) {
         print_stream.warning("Cannot run {:s} ({:s}, attempt {:d} of {:d})", command_line, error.what(), attempt, max_attempts);
      }

      if(attempt < max_attempts)
         std::this_thread::sleep_for(retry_policy.delay);
   }

   print_stream.error("Cannot copy files into {:s} after {:d} attempts", destination_root.u8string(), max_attempts);

   return false;
}

bool copy_executor_t::copy(const std::filesystem::path& source_root, const std::filesystem::path& destination_root)
{
   std::vector<std::string> command = backend.copy_command(source_root, destination_root);

   if(dry_run) {
      print_stream.info("Would copy {:s} into {:s} with {:s}", source_root.u8string(), destination_root.u8string(), join_command(command));
      return true;
   }

   print_stream.info("Copying {:s} into {:s}", source_root.u8string(), destination_root.u8string());

   return run_with_retries(command, destination_root);
}

bool copy_executor_t::copy_from_list(const std::filesystem::path& list_path, const std::filesystem::path& destination_root)
{
   std::error_code errcode;

   if(!std::filesystem::is_regular_file(list_path, errcode))
      throw import_error_t(error_kind_t::path_not_found, FMTNS::format("List file {:s} does not exist"sv, list_path.u8string()));

   if(dry_run)
      throw import_error_t(error_kind_t::unsupported_operation, FMTNS::format("Copying files listed in {:s} is not supported in a dry run"sv, list_path.u8string()));

   std::vector<std::string> command = backend.list_copy_command(list_path, destination_root);

   print_stream.info("Copying files listed in {:s} into {:s}", list_path.u8string(), destination_root.u8string());

   return run_with_retries(command, destination_root);
}

}
