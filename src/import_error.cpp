#include "import_error.h"

namespace sdimport {

const char *error_kind_name(error_kind_t kind)
{
   switch(kind) {
      case error_kind_t::path_not_found:
         return "path not found";
      case error_kind_t::not_writable:
         return "not writable";
      case error_kind_t::path_too_long:
         return "path too long";
      case error_kind_t::copy_failed:
         return "copy failed";
      case error_kind_t::checksum_mismatch:
         return "checksum mismatch";
      case error_kind_t::name_collision_unresolved:
         return "unresolved name collision";
      case error_kind_t::unsupported_operation:
         return "unsupported operation";
   }

   return "unknown error";
}

import_error_t::import_error_t(error_kind_t kind, const std::string& message) :
      std::runtime_error(message),
      kind(kind)
{
}

error_kind_t import_error_t::get_kind(void) const
{
   return kind;
}

}
