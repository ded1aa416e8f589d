#include "path_builder.h"
#include "import_error.h"
#include "format.h"

#include <algorithm>

using namespace std::literals::string_view_literals;
using namespace std::literals::string_literals;

namespace sdimport {

namespace {

// returns a lexically normal root without trailing separators, which would be doubled in generated paths
std::filesystem::path normalize_root(const std::filesystem::path& archive_root)
{
   std::u8string root = archive_root.lexically_normal().generic_u8string();

   while(root.size() > 1 && root.back() == u8'/')
      root.pop_back();

   return std::filesystem::path(root);
}

}

path_builder_t::path_builder_t(const std::filesystem::path& archive_root, size_t path_limit) :
      archive_root(normalize_root(archive_root)),
      archive_root_size(this->archive_root.generic_u8string().size()),
      path_limit(path_limit)
{
}

std::string path_builder_t::date_dir_names(const std::optional<std::chrono::year_month_day>& capture_date, std::string& day_dir)
{
   if(!capture_date.has_value()) {
      day_dir = "0000-00-00"s;
      return "0000"s;
   }

   int year = static_cast<int>(capture_date->year());
   unsigned month = static_cast<unsigned>(capture_date->month());
   unsigned day = static_cast<unsigned>(capture_date->day());

   day_dir = FMTNS::format("{:04d}-{:02d}-{:02d}"sv, year, month, day);

   return FMTNS::format("{:04d}"sv, year);
}


size_t path_builder_t::utf8_prefix_size(std::string_view name, size_t size)
{
   if(size >= name.size())
      return name.size();

   // back off continuation bytes (10xxxxxx) to the start of the sequence at `size`
   while(size > 0 && (static_cast<unsigned char>(name[size]) & 0xC0) == 0x80)
      size--;

   return size;
}

//
// Full names carry all attributes:
//
//     {date}_{camera}_{number}_{eb}EB_{ev}EV_{b}B_{iso}ISO_{ss}SS_{lens}.{ext}
//
// Short names carry only the sequence number and exposure values:
//
//     {number}_{eb}EB_{ev}EV_{b}B.{ext}
//
// Missing labeled values are rendered with their label in place of
// the value (e.g. `SSSS` for an unknown shutter speed), so fields
// remain in the same positions. Missing camera and lens are empty.
//
std::string path_builder_t::generate_name(const photo_record_t& record, bool short_name, const name_overrides_t& overrides)
{
   const photo_attributes_t& attrs = record.get_attributes();

   auto labeled = [](const std::optional<std::string>& override_value, const std::optional<std::string>& value, std::string_view label) -> std::string
   {
      const std::optional<std::string>& actual = override_value.has_value() ? override_value : value;

      return FMTNS::format("{:s}{:s}"sv, actual.has_value() ? std::string_view(actual.value()) : label, label);
   };

   std::string name;

   if(!short_name) {
      std::optional<std::chrono::year_month_day> capture_date = overrides.capture_date.has_value() ? overrides.capture_date : attrs.capture_date;

      if(capture_date.has_value())
         name = FMTNS::format("{:04d}{:02d}{:02d}"sv, static_cast<int>(capture_date->year()), static_cast<unsigned>(capture_date->month()), static_cast<unsigned>(capture_date->day()));
      else
         name = "00000000"s;

      name += '_';
      name += overrides.camera.value_or(attrs.camera.value_or(std::string()));
      name += '_';
   }

   name += overrides.sequence_number.value_or(attrs.sequence_number);
   name += '_';
   name += labeled(overrides.exposure_bias, attrs.exposure_bias, "EB"sv);
   name += '_';
   name += labeled(overrides.exposure_value, attrs.exposure_value, "EV"sv);
   name += '_';
   name += labeled(overrides.brightness, attrs.brightness, "B"sv);

   if(!short_name) {
      std::optional<uint32_t> iso = overrides.iso.has_value() ? overrides.iso : attrs.iso;

      name += '_';
      name += labeled(std::nullopt, iso.has_value() ? std::optional<std::string>(std::to_string(iso.value())) : std::nullopt, "ISO"sv);
      name += '_';
      name += labeled(overrides.shutter_speed, attrs.shutter_speed, "SS"sv);
      name += '_';
      name += overrides.lens.value_or(attrs.lens.value_or(std::string()));
   }

   // the extension is the only part of the name that may have a period
   std::replace(name.begin(), name.end(), '.', ' ');

   if(!record.get_extension().empty()) {
      name += '.';
      name += record.get_extension();
   }

   return name;
}

//
// Returns the first of the full name, the short name or the truncated
// short name that fits within the path limit after a directory path of
// `dir_size` bytes, which includes the trailing separator.
//
std::string path_builder_t::fit_name(const photo_record_t& record, const name_overrides_t& overrides, size_t dir_size, const std::filesystem::path& directory) const
{
   const std::string& ext = record.get_extension();

   // room left for a truncated name, without the marker, the period and the extension
   size_t overhead = dir_size + ext.size() + TRUNCATION_MARKER.size() + 1;

   if(path_limit <= overhead)
      throw import_error_t(error_kind_t::path_too_long, FMTNS::format("Directory {:s} leaves no room for file names within {:d} bytes"sv, directory.u8string(), path_limit));

   size_t budget = path_limit - overhead;

   std::string name = generate_name(record, false, overrides);

   if(dir_size + name.size() > path_limit) {
      name = generate_name(record, true, overrides);

      if(dir_size + name.size() > path_limit) {
         std::string_view stem(name.data(), ext.empty() ? name.size() : name.size() - ext.size() - 1);

         std::string truncated(stem.substr(0, utf8_prefix_size(stem, budget)));

         truncated += TRUNCATION_MARKER;

         if(!ext.empty()) {
            truncated += '.';
            truncated += ext;
         }

         name = std::move(truncated);
      }
   }

   return name;
}

std::filesystem::path path_builder_t::generate_path(const photo_record_t& record, const name_overrides_t& overrides) const
{
   std::string day_dir;
   std::string year_dir = date_dir_names(overrides.capture_date.has_value() ? overrides.capture_date : record.get_attributes().capture_date, day_dir);

   std::string name = fit_name(record, overrides, archive_root_size + DATE_DIRS_SIZE, archive_root);

   return archive_root / svtou8(year_dir) / svtou8(day_dir) / svtou8(name);
}

std::filesystem::path path_builder_t::generate_path_in(const std::filesystem::path& directory, const photo_record_t& record, const name_overrides_t& overrides) const
{
   std::filesystem::path normal_dir = normalize_root(directory);

   std::string name = fit_name(record, overrides, normal_dir.generic_u8string().size() + 1, normal_dir);

   return normal_dir / svtou8(name);
}

std::filesystem::path path_builder_t::disambiguate(const std::filesystem::path& canonical_path, size_t n) const
{
   std::u8string u8stem = canonical_path.stem().u8string();
   std::u8string u8ext = canonical_path.extension().u8string();

   std::string stem(u8tosv(u8stem));
   std::string suffix = FMTNS::format(" ({:d})"sv, n);

   size_t total = canonical_path.parent_path().generic_u8string().size() + 1 + stem.size() + suffix.size() + u8ext.size();

   if(total > path_limit) {
      size_t excess = total - path_limit;

      if(excess >= stem.size())
         throw import_error_t(error_kind_t::path_too_long, FMTNS::format("Cannot fit a suffix{:s} into {:s}"sv, suffix, canonical_path.u8string()));

      stem.resize(utf8_prefix_size(stem, stem.size() - excess));
   }

   stem += suffix;
   stem += u8tosv(u8ext);

   return canonical_path.parent_path() / svtou8(stem);
}

}
