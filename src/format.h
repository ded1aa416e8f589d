#ifndef SDIMPORT_FORMAT_H
#define SDIMPORT_FORMAT_H

#include <string>
#include <string_view>
#include <cstdint>

#if defined(_MSC_VER) || (defined(__GNUC__) && __GNUC__ >= 13)
#include <format>
#define FMTNS std
#define FMTSV(fmt) (fmt).get()
#else
#include <fmt/format.h>
#define FMTNS fmt
#define FMTSV(fmt) FMTNS::string_view(fmt)
#endif

//
// Within this project std::string and std::string_view always
// carry UTF-8 strings, so we can just cast the character pointer,
// without applying any character encoding conversions.
//
template <>
struct FMTNS::formatter<std::u8string, char> : FMTNS::formatter<std::string_view, char> {
      template<class format_context_t>
      auto format(const std::u8string& u8str, format_context_t& fmtctx) const
      {
         return FMTNS::formatter<std::string_view, char>::format(std::string_view(reinterpret_cast<const char*>(u8str.data()), u8str.size()), fmtctx);
      }
};

namespace sdimport {

// returns a view of a UTF-8 string as a character string (the string must outlive the view)
inline std::string_view u8tosv(const std::u8string& u8str)
{
   return std::string_view(reinterpret_cast<const char*>(u8str.data()), u8str.size());
}

// returns a view of a UTF-8 character string as a UTF-8 string (e.g. to construct a path)
inline std::u8string_view svtou8(std::string_view str)
{
   return std::u8string_view(reinterpret_cast<const char8_t*>(str.data()), str.size());
}

std::string hr_bytes(uint64_t bytes);

std::string fmt_rational(int64_t numerator, int64_t denominator);

std::string fmt_decimal(double value, int decimals);

}

#endif // SDIMPORT_FORMAT_H
