#ifndef SDIMPORT_FILE_HASHER_H
#define SDIMPORT_FILE_HASHER_H

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <cstddef>

namespace sdimport {

//
// The outcome of hashing one file. `digest` is a lower-case hex
// string and is empty if the file could not be opened or read,
// in which case `error` describes the failure.
//
struct hash_result_t {
   std::optional<std::string> digest;
   std::string error;
};

//
// Computes SHA-256 file checksums with isa-l_crypto multi-buffer
// contexts, which hash blocks from up to `max_jobs` files in
// parallel on a single thread.
//
// A hasher holds only its configuration and may be shared between
// threads. Each call allocates its own context manager.
//
class file_hasher_t {
   public:
      // align memory by this amount based on AVX512 where it is relevant
      static constexpr size_t ALIGN_MEM = 64;

   private:
      size_t buf_size;
      size_t max_jobs;

   public:
      file_hasher_t(size_t buf_size, size_t max_jobs);

      std::vector<hash_result_t> hash_files(const std::vector<std::filesystem::path>& filepaths) const;

      // throws `std::runtime_error` if the file cannot be hashed
      std::string hash_file(const std::filesystem::path& filepath) const;
};

}

#endif // SDIMPORT_FILE_HASHER_H
