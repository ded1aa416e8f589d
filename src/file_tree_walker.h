#ifndef SDIMPORT_FILE_TREE_WALKER_H
#define SDIMPORT_FILE_TREE_WALKER_H

#include "print_stream.h"

#include <string>
#include <filesystem>
#include <vector>

#include <cstdint>

namespace sdimport {

//
// A class that traverses a file tree and collects regular files,
// in a sorted order, so queues and reports are the same for every
// run against the same tree.
//
class file_tree_walker_t {
   private:
      print_stream_t& print_stream;

      bool interrupted_walk = false;

      uint64_t found_size = 0;

   private:
      void report_walk_error(const std::filesystem::filesystem_error& error);

   public:
      file_tree_walker_t(print_stream_t& print_stream);

      template <typename dir_iter_t>
      std::vector<std::filesystem::path> walk_tree(const std::filesystem::path& root);

      bool was_walk_completed(void) const;

      uint64_t get_found_size(void) const;
};

}

#endif // SDIMPORT_FILE_TREE_WALKER_H
