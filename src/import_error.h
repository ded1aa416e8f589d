#ifndef SDIMPORT_IMPORT_ERROR_H
#define SDIMPORT_IMPORT_ERROR_H

#include <string>
#include <stdexcept>
#include <filesystem>

namespace sdimport {

enum class error_kind_t {
   path_not_found,               // a configured root does not exist
   not_writable,                 // a configured root or a target directory cannot be written
   path_too_long,                // no canonical path fits within the path limit
   copy_failed,                  // the copy command failed after all attempts
   checksum_mismatch,            // copied content differs from the source
   name_collision_unresolved,    // all disambiguated names are taken
   unsupported_operation         // e.g. a list copy in a dry run
};

const char *error_kind_name(error_kind_t kind);

//
// Thrown for failures that prevent an operation from starting, such
// as a missing archive root. Failures of individual files are not
// thrown and are collected as `file_error_t` instead.
//
class import_error_t : public std::runtime_error {
   private:
      error_kind_t kind;

   public:
      import_error_t(error_kind_t kind, const std::string& message);

      error_kind_t get_kind(void) const;
};

//
// An error recorded against a single file, with both paths, where
// known, so files can be reconciled manually after a failed import.
//
struct file_error_t {
   error_kind_t kind;

   std::filesystem::path source;
   std::filesystem::path destination;

   std::string message;
};

}

#endif // SDIMPORT_IMPORT_ERROR_H
