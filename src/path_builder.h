#ifndef SDIMPORT_PATH_BUILDER_H
#define SDIMPORT_PATH_BUILDER_H

#include "photo_record.h"

#include <string>
#include <string_view>
#include <optional>
#include <filesystem>
#include <chrono>

#include <cstddef>

namespace sdimport {

//
// Values that replace record attributes when a name is generated.
// A legacy name migration knows the sequence number from the old
// name, but derives everything else from the file metadata.
//
struct name_overrides_t {
   std::optional<std::chrono::year_month_day> capture_date;

   std::optional<std::string> camera;
   std::optional<std::string> lens;

   std::optional<std::string> exposure_bias;
   std::optional<std::string> exposure_value;
   std::optional<std::string> brightness;
   std::optional<uint32_t> iso;
   std::optional<std::string> shutter_speed;

   std::optional<std::string> sequence_number;
};

//
// Builds canonical archive names and paths for raw files, which
// look like this:
//
//     {root}/2023/2023-08-05/20230805_a7r4_1234_-2 7EB_10EV_8 27B_800ISO_1-250SS_SAMYANG AF 12mm F2 0.arw
//
// Decimal points within the name are replaced with spaces, so the
// only period in a name separates the extension. Path lengths are
// measured in bytes of the UTF-8 path and are kept within the path
// limit by falling back to a short name and then by truncating the
// short name, which is marked with `---` before the extension.
//
class path_builder_t {
   public:
      // "/YYYY/YYYY-mm-dd/"
      static constexpr size_t DATE_DIRS_SIZE = 17;

      static constexpr std::string_view TRUNCATION_MARKER = "---";

   private:
      std::filesystem::path archive_root;

      size_t archive_root_size;

      size_t path_limit;

   private:
      static std::string date_dir_names(const std::optional<std::chrono::year_month_day>& capture_date, std::string& day_dir);

      std::string fit_name(const photo_record_t& record, const name_overrides_t& overrides, size_t dir_size, const std::filesystem::path& directory) const;

   public:
      path_builder_t(const std::filesystem::path& archive_root, size_t path_limit);

      static std::string generate_name(const photo_record_t& record, bool short_name, const name_overrides_t& overrides = name_overrides_t{});

      // throws `import_error_t` with `path_too_long` if no name fits within the path limit
      std::filesystem::path generate_path(const photo_record_t& record, const name_overrides_t& overrides = name_overrides_t{}) const;

      // same as `generate_path`, but places the file in the directory instead of a dated one
      std::filesystem::path generate_path_in(const std::filesystem::path& directory, const photo_record_t& record, const name_overrides_t& overrides = name_overrides_t{}) const;

      //
      // Returns a canonical path with ` (n)` inserted before the extension,
      // shortening the name, if needed, to remain within the path limit.
      //
      std::filesystem::path disambiguate(const std::filesystem::path& canonical_path, size_t n) const;

      // returns the number of bytes in a name that fit before the position, without splitting a UTF-8 sequence
      static size_t utf8_prefix_size(std::string_view name, size_t size);
};

}

#endif // SDIMPORT_PATH_BUILDER_H
