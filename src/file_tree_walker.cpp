#include "file_tree_walker.h"

#include <algorithm>
#include <stdexcept>

namespace sdimport {

static const char *enum_files_error_msg = "Cannot enumerate files";

file_tree_walker_t::file_tree_walker_t(print_stream_t& print_stream) :
      print_stream(print_stream)
{
}

//
// Both error paths are populated for two-argument commands, such as
// `rename`, and for iterating directories none of them may be set,
// so print all that are not empty.
//
void file_tree_walker_t::report_walk_error(const std::filesystem::filesystem_error& error)
{
   if(error.path1().empty() && error.path2().empty())
      print_stream.error("{:s} ({:s})", enum_files_error_msg, error.code().message());
   else if(!error.path1().empty() && !error.path2().empty())
      print_stream.error("{:s} ({:s}) for \"{:s}\" and \"{:s}\"", enum_files_error_msg, error.code().message(), error.path1().u8string(), error.path2().u8string());
   else if(!error.path1().empty())
      print_stream.error("{:s} ({:s}) for \"{:s}\"", enum_files_error_msg, error.code().message(), error.path1().u8string());
   else
      print_stream.error("{:s} ({:s}) for \"{:s}\"", enum_files_error_msg, error.code().message(), error.path2().u8string());
}

template <typename dir_iter_t>
std::vector<std::filesystem::path> file_tree_walker_t::walk_tree(const std::filesystem::path& root)
{
   std::vector<std::filesystem::path> files;

   interrupted_walk = false;
   found_size = 0;

   try {
      for(const std::filesystem::directory_entry& dir_entry : dir_iter_t(root)) {
         //
         // A symlink is also presented as a regular file and we want
         // to skip symbolic links because their targets are either
         // picked up on their own or are outside of the walked tree.
         //
         if(!dir_entry.is_symlink() && dir_entry.is_regular_file()) {
            files.push_back(dir_entry.path());
            found_size += dir_entry.file_size();
         }
      }
   }
   catch (const std::filesystem::filesystem_error& error) {
      report_walk_error(error);

      // a partial list cannot be used to plan copies or to reorganize files
      interrupted_walk = true;
   }
   catch (const std::exception& error) {
      print_stream.error("{:s} ({:s})", enum_files_error_msg, error.what());
      interrupted_walk = true;
   }

   std::sort(files.begin(), files.end());

   return files;
}

bool file_tree_walker_t::was_walk_completed(void) const
{
   return !interrupted_walk;
}

uint64_t file_tree_walker_t::get_found_size(void) const
{
   return found_size;
}

}

template std::vector<std::filesystem::path> sdimport::file_tree_walker_t::walk_tree<std::filesystem::recursive_directory_iterator>(const std::filesystem::path& root);
