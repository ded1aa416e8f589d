#ifndef SDIMPORT_PHOTO_RECORD_H
#define SDIMPORT_PHOTO_RECORD_H

#include "file_hasher.h"

#include <string>
#include <optional>
#include <filesystem>
#include <chrono>
#include <mutex>
#include <memory>

#include <cstdint>

namespace sdimport {

//
// Attributes derived from the embedded image metadata. Exposure
// values are kept as formatted text, the way they appear in file
// names (e.g. `-2.7` for exposure bias).
//
struct photo_attributes_t {
   std::optional<std::chrono::year_month_day> capture_date;

   std::optional<std::string> camera;
   std::optional<std::string> lens;

   std::optional<std::string> exposure_bias;
   std::optional<std::string> exposure_value;
   std::optional<std::string> brightness;
   std::optional<uint32_t> iso;
   std::optional<std::string> shutter_speed;

   // normally the trailing digits of the file name (e.g. `01234` in `DSC01234.ARW`)
   std::string sequence_number;
};

//
// An immutable view of one photo file. The content hash is computed
// on first use and cached for the lifetime of the record. Records
// are shared via `std::shared_ptr` because the cached hash cannot be
// copied along with the record.
//
class photo_record_t {
   private:
      std::filesystem::path source_path;

      std::string extension;

      photo_attributes_t attributes;

      const file_hasher_t& file_hasher;

      mutable std::once_flag hash_once;
      mutable hash_result_t hash_result;

   public:
      photo_record_t(const std::filesystem::path& source_path, photo_attributes_t&& attributes, const file_hasher_t& file_hasher);

      photo_record_t(const photo_record_t&) = delete;
      photo_record_t& operator = (const photo_record_t&) = delete;

      // returns a lower-case extension without the period (e.g. `arw`)
      static std::string parse_extension(const std::filesystem::path& filepath);

      // returns trailing digits of the file stem, or `unknown` if there are none
      static std::string parse_sequence_number(const std::filesystem::path& filepath);

      const std::filesystem::path& get_source_path(void) const;

      const std::string& get_extension(void) const;

      const photo_attributes_t& get_attributes(void) const;

      // throws `std::runtime_error` if the file could not be hashed, on this or any earlier call
      const std::string& content_hash(void) const;

      //
      // Supplies a hash computed in a batch with other files. Returns
      // `false` if the hash was already computed, in which case the
      // supplied one is discarded.
      //
      bool prime_content_hash(hash_result_t&& result) const;
};

typedef std::shared_ptr<const photo_record_t> photo_record_ptr_t;

//
// A source of photo records, which extracts metadata from image files.
//
class metadata_source_t {
   public:
      virtual ~metadata_source_t(void) = default;

      virtual photo_record_ptr_t read_record(const std::filesystem::path& filepath) = 0;
};

}

#endif // SDIMPORT_PHOTO_RECORD_H
