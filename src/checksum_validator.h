#ifndef SDIMPORT_CHECKSUM_VALIDATOR_H
#define SDIMPORT_CHECKSUM_VALIDATOR_H

#include "file_hasher.h"
#include "print_stream.h"

#include <string>
#include <map>
#include <filesystem>

namespace sdimport {

// source path -> lower-case hex checksum
typedef std::map<std::filesystem::path, std::string> checksum_map_t;

//
// Compares checksums of copied files against checksums captured
// before they were copied. Every missing or mismatched file is
// logged on its own before the aggregate result is returned.
//
class checksum_validator_t {
   private:
      const file_hasher_t& file_hasher;

      print_stream_t& print_stream;

   public:
      checksum_validator_t(const file_hasher_t& file_hasher, print_stream_t& print_stream);

      //
      // Checks that every source file was copied into the destination
      // directory under the same file name and has the same checksum.
      //
      bool validate_checksums(const checksum_map_t& before, const std::filesystem::path& destination_root) const;

      //
      // Checks that every source in `destinations` (source -> copied file)
      // has the same checksum as recorded for it in `before`.
      //
      bool validate_checksum_list(const checksum_map_t& before, const std::map<std::filesystem::path, std::filesystem::path>& destinations) const;

      // returns `true` if both files exist and have the same content
      bool compare_checksums(const std::filesystem::path& path_a, const std::filesystem::path& path_b) const;

      // returns `true` if the file exists and has the specified checksum
      bool compare_checksum(const std::filesystem::path& filepath, const std::string& checksum) const;
};

}

#endif // SDIMPORT_CHECKSUM_VALIDATOR_H
