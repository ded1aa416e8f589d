#ifndef SDIMPORT_EXIF_READER_H
#define SDIMPORT_EXIF_READER_H

#include "photo_record.h"
#include "file_hasher.h"
#include "print_stream.h"

#include <string>
#include <string_view>
#include <set>
#include <vector>
#include <filesystem>
#include <optional>
#include <chrono>

namespace sdimport {
namespace exif {

//
// A metadata source that reads EXIF attributes with Exiv2 for files
// with one of the configured extensions. Files with other extensions,
// or files whose EXIF cannot be read, produce records without any
// attributes, so they still can be routed by their extension.
//
class exif_reader_t : public metadata_source_t {
   private:
      static const std::string_view whitespace;

      std::set<std::string> exif_exts;

      const file_hasher_t& file_hasher;

      print_stream_t& print_stream;

   private:
      photo_attributes_t read_attributes(const std::filesystem::path& filepath);

   public:
      exif_reader_t(const std::vector<std::string>& exif_exts, const file_hasher_t& file_hasher, print_stream_t& print_stream);

      static void initialize(print_stream_t& print_stream);

      static void cleanup(print_stream_t& print_stream) noexcept;

      //
      // Trims whitespace and replaces characters that cannot be used in
      // a file name, or that separate fields in a generated name, with
      // dashes and spaces. Returns an empty value for an empty result.
      //
      static std::optional<std::string> sanitize_text(std::string_view value);

      static std::optional<std::chrono::year_month_day> parse_exif_date(std::string_view value);

      // formats an exposure time as `1-250` for fractions of a second or as seconds otherwise
      static std::string fmt_shutter_speed(double exposure_time);

      // computes an exposure value from an f-number and an exposure time in seconds
      static std::string fmt_exposure_value(double fnumber, double exposure_time);

      photo_record_ptr_t read_record(const std::filesystem::path& filepath) override;
};

}
}

#endif // SDIMPORT_EXIF_READER_H
