#include "format.h"

#include <stdexcept>
#include <cmath>
#include <algorithm>

using namespace std::literals::string_view_literals;
using namespace std::literals::string_literals;

namespace sdimport {

//
// Removes trailing zeros after the decimal point, along with the
// decimal point itself if nothing remains after it (e.g. `2.50`
// becomes `2.5` and `10.0` becomes `10`).
//
static std::string trim_fraction(std::string&& value)
{
   if(value.find('.') == std::string::npos)
      return std::move(value);

   while(value.back() == '0')
      value.pop_back();

   if(value.back() == '.')
      value.pop_back();

   // -0.0 rounds to "-0", which is not meaningful in a name
   if(value == "-0"sv)
      return "0"s;

   return std::move(value);
}

//
// Formats byte counts with SI unit prefixes, with two decimals for
// GB and below and with three decimals for larger units, omitting
// trailing zeros (e.g. `12.3 GB`, not `12.30 GB`).
//
std::string hr_bytes(uint64_t bytes)
{
   static const char *si_unit_pfx[] = {"", "K", "M", "G", "T", "P", "E"};

   if(bytes < 1000)
      return FMTNS::format("{:d} {:s}"sv, bytes, bytes == 1 ? "byte" : "bytes");

   size_t prefix = 0;
   uint64_t divisor = 1;

   while(bytes / divisor >= 1000 && prefix + 1 < sizeof(si_unit_pfx)/sizeof(si_unit_pfx[0])) {
      divisor *= 1000;
      prefix++;
   }

   int decimals = prefix < 4 ? 2 : 3;

   // split the value to avoid losing precision for values past 2^53
   double value = static_cast<double>(bytes / divisor) + static_cast<double>(bytes % divisor) / static_cast<double>(divisor);

   std::string number = trim_fraction(FMTNS::format("{:.{}f}"sv, value, decimals));

   // rounding may push a value to the next unit (e.g. 999,999 bytes is 1000 KB)
   if(number == "1000"sv && prefix + 1 < sizeof(si_unit_pfx)/sizeof(si_unit_pfx[0]))
      return FMTNS::format("1 {:s}B"sv, si_unit_pfx[prefix+1]);

   return FMTNS::format("{:s} {:s}B"sv, number, si_unit_pfx[prefix]);
}

//
// Formats an EXIF rational with as many decimals as the denominator
// implies (e.g. 1/10 yields one decimal and 1/100 yields two), which
// follows libexif. Trailing zeros are removed.
//
std::string fmt_rational(int64_t numerator, int64_t denominator)
{
   if(!denominator)
      throw std::invalid_argument(FMTNS::format("A rational {:d}/{:d} has a zero denominator"sv, numerator, denominator));

   int decimals = std::max(0, static_cast<int>(std::log10(std::abs(static_cast<double>(denominator))) - 0.08 + 1.0));

   return fmt_decimal(static_cast<double>(numerator) / static_cast<double>(denominator), decimals);
}

std::string fmt_decimal(double value, int decimals)
{
   if(!std::isfinite(value))
      throw std::invalid_argument("Cannot format a non-finite number");

   return trim_fraction(FMTNS::format("{:.{}f}"sv, value, std::max(decimals, 0)));
}

}
