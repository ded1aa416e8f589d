#include "exif_reader.h"
#include "format.h"

#include <exiv2/exiv2.hpp>

#include <cmath>
#include <cctype>
#include <cstring>
#include <charconv>
#include <stdexcept>

using namespace std::literals::string_view_literals;

namespace sdimport {
namespace exif {

//
// Exiv2 does not provide numeric constants for tags and string names
// are slower to process, so these constants are used instead. Their
// names and values are copied from libexif/0.6.24.
//
constexpr unsigned int EXIF_TAG_MODEL                 = 0x0110;
constexpr unsigned int EXIF_TAG_EXPOSURE_TIME         = 0x829a;
constexpr unsigned int EXIF_TAG_FNUMBER               = 0x829d;
constexpr unsigned int EXIF_TAG_ISO_SPEED_RATINGS     = 0x8827;
constexpr unsigned int EXIF_TAG_DATE_TIME_ORIGINAL    = 0x9003;
constexpr unsigned int EXIF_TAG_BRIGHTNESS_VALUE      = 0x9203;
constexpr unsigned int EXIF_TAG_EXPOSURE_BIAS_VALUE   = 0x9204;
constexpr unsigned int EXIF_TAG_LENS_MODEL            = 0xa434;

const std::string_view exif_reader_t::whitespace = "\n \t\r"sv;

exif_reader_t::exif_reader_t(const std::vector<std::string>& exif_exts, const file_hasher_t& file_hasher, print_stream_t& print_stream) :
      exif_exts(exif_exts.begin(), exif_exts.end()),
      file_hasher(file_hasher),
      print_stream(print_stream)
{
}

void exif_reader_t::initialize(print_stream_t& print_stream)
{
   if(!Exiv2::XmpParser::initialize())
      throw std::runtime_error("Cannot initialize the XMP parser library in Exiv2");
}

void exif_reader_t::cleanup(print_stream_t& print_stream) noexcept
{
   try {
      Exiv2::XmpParser::terminate();
   }
   catch (const std::exception& error) {
      print_stream.error("Cannot clean up XMP parser ({:s})", error.what());
   }
}

std::optional<std::string> exif_reader_t::sanitize_text(std::string_view value)
{
   // ASCII values are null-terminated, but may have garbage after the terminator
   std::string_view::size_type null_pos = value.find('\0');

   if(null_pos != std::string_view::npos)
      value = value.substr(0, null_pos);

   while(!value.empty() && whitespace.find(value.front()) != std::string_view::npos)
      value.remove_prefix(1);

   while(!value.empty() && whitespace.find(value.back()) != std::string_view::npos)
      value.remove_suffix(1);

   if(value.empty())
      return std::nullopt;

   std::string text(value);

   for(char& chr : text) {
      if(chr == '/' || chr == '\\' || chr == ':' || std::iscntrl(static_cast<unsigned char>(chr)))
         chr = '-';
      else if(chr == '_')
         chr = ' ';
   }

   return text;
}

std::optional<std::chrono::year_month_day> exif_reader_t::parse_exif_date(std::string_view value)
{
   //     4  7
   // YYYY:MM:DD HH:MM:SS
   if(value.size() < 10 || value[4] != ':' || value[7] != ':')
      return std::nullopt;

   int year = 0;
   unsigned month = 0, day = 0;

   if(std::from_chars(value.data(), value.data() + 4, year).ptr != value.data() + 4 ||
         std::from_chars(value.data() + 5, value.data() + 7, month).ptr != value.data() + 7 ||
         std::from_chars(value.data() + 8, value.data() + 10, day).ptr != value.data() + 10)
      return std::nullopt;

   // cameras without a clock set write zeros or spaces
   std::chrono::year_month_day date{std::chrono::year(year), std::chrono::month(month), std::chrono::day(day)};

   if(!date.ok() || year == 0)
      return std::nullopt;

   return date;
}

std::string exif_reader_t::fmt_shutter_speed(double exposure_time)
{
   if(exposure_time <= 0 || !std::isfinite(exposure_time))
      throw std::invalid_argument("Exposure time must be a positive number");

   if(exposure_time < 1)
      return FMTNS::format("1-{:.0f}"sv, 1. / exposure_time);

   return fmt_decimal(exposure_time, 1);
}

std::string exif_reader_t::fmt_exposure_value(double fnumber, double exposure_time)
{
   if(fnumber <= 0 || exposure_time <= 0)
      throw std::invalid_argument("F-number and exposure time must be positive numbers");

   return fmt_decimal(std::log2(fnumber * fnumber / exposure_time), 1);
}

photo_attributes_t exif_reader_t::read_attributes(const std::filesystem::path& filepath)
{
   photo_attributes_t attributes;

   try {
#ifdef _WIN32
      Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(filepath);
#else
      Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(filepath.string(), false /* useCurl? */);
#endif

      if(!image)
         return attributes;

      image->readMetadata();

      const Exiv2::ExifData& exif_data = image->exifData();

      std::optional<double> fnumber;
      std::optional<double> exposure_time;

      //
      // Walk all tags found in a file and pick the ones used in names
      // by their numeric values, which is faster than looking up each
      // tag by its key.
      //
      for(Exiv2::ExifData::const_iterator i = exif_data.begin(); i != exif_data.end(); ++i) {
         // maker notes reuse tag values, so only the main image (1) and EXIF (5) IFDs are considered
         if(i->ifdId() != Exiv2::IfdId::ifd0Id && i->ifdId() != Exiv2::IfdId::exifId)
            continue;

         // Exiv2 throws from value() for null values
         if(i->typeId() == Exiv2::invalidTypeId || !i->count())
            continue;

         const Exiv2::Value& exif_value = i->value();

         switch(i->tag()) {
            case EXIF_TAG_MODEL:
               if(exif_value.typeId() == Exiv2::TypeId::asciiString)
                  attributes.camera = sanitize_text(static_cast<const Exiv2::AsciiValue&>(exif_value).value_);
               break;
            case EXIF_TAG_LENS_MODEL:
               if(exif_value.typeId() == Exiv2::TypeId::asciiString)
                  attributes.lens = sanitize_text(static_cast<const Exiv2::AsciiValue&>(exif_value).value_);
               break;
            case EXIF_TAG_DATE_TIME_ORIGINAL:
               if(exif_value.typeId() == Exiv2::TypeId::asciiString)
                  attributes.capture_date = parse_exif_date(static_cast<const Exiv2::AsciiValue&>(exif_value).value_);
               break;
            case EXIF_TAG_EXPOSURE_BIAS_VALUE:
            case EXIF_TAG_BRIGHTNESS_VALUE:
               if(exif_value.typeId() == Exiv2::TypeId::signedRational) {
                  Exiv2::Rational rational = static_cast<const Exiv2::ValueType<Exiv2::Rational>&>(exif_value).value_.front();

                  // a zero denominator is how cameras record an unknown value
                  if(rational.second) {
                     if(i->tag() == EXIF_TAG_EXPOSURE_BIAS_VALUE)
                        attributes.exposure_bias = fmt_rational(rational.first, rational.second);
                     else
                        attributes.brightness = fmt_rational(rational.first, rational.second);
                  }
               }
               break;
            case EXIF_TAG_ISO_SPEED_RATINGS:
               // renamed to PhotographicSensitivity in later EXIF versions
               if(exif_value.typeId() == Exiv2::TypeId::unsignedShort || exif_value.typeId() == Exiv2::TypeId::unsignedLong)
                  attributes.iso = exif_value.toUint32(0);
               break;
            case EXIF_TAG_EXPOSURE_TIME:
            case EXIF_TAG_FNUMBER:
               if(exif_value.typeId() == Exiv2::TypeId::unsignedRational) {
                  Exiv2::URational rational = static_cast<const Exiv2::ValueType<Exiv2::URational>&>(exif_value).value_.front();

                  if(rational.first && rational.second) {
                     double value = static_cast<double>(rational.first) / static_cast<double>(rational.second);

                     if(i->tag() == EXIF_TAG_EXPOSURE_TIME)
                        exposure_time = value;
                     else
                        fnumber = value;
                  }
               }
               break;
            default:
               break;
         }
      }

      if(exposure_time.has_value()) {
         attributes.shutter_speed = fmt_shutter_speed(exposure_time.value());

         if(fnumber.has_value())
            attributes.exposure_value = fmt_exposure_value(fnumber.value(), exposure_time.value());
      }
   }
   catch (const std::exception& error) {
      print_stream.error("Cannot read EXIF for {:s} ({:s})", filepath.u8string(), error.what());

      // discard a partially filled set of attributes
      return photo_attributes_t{};
   }

   return attributes;
}

photo_record_ptr_t exif_reader_t::read_record(const std::filesystem::path& filepath)
{
   photo_attributes_t attributes;

   if(exif_exts.contains(photo_record_t::parse_extension(filepath)))
      attributes = read_attributes(filepath);

   return std::make_shared<const photo_record_t>(filepath, std::move(attributes), file_hasher);
}

}
}
