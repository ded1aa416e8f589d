#include <gtest/gtest.h>

#include "../format.h"

#include <string>
#include <limits>
#include <stdexcept>

using namespace std::literals::string_view_literals;
using namespace std::literals::string_literals;

namespace sdimport {
namespace test {

TEST(hr_bytes_suite, max_uint64_test)
{
   // 18,446,744,073,709,551,615
   ASSERT_EQ("18.447 EB"s, sdimport::hr_bytes(std::numeric_limits<uint64_t>::max()));
}

TEST(hr_bytes_suite, zero_bytes_test)
{
   ASSERT_EQ("0 bytes"s, sdimport::hr_bytes(UINT64_C(0)));
}

TEST(hr_bytes_suite, one_byte_test)
{
   ASSERT_EQ("1 byte"s, sdimport::hr_bytes(UINT64_C(1)));
}

TEST(hr_bytes_suite, hundreds_bytes_test)
{
   ASSERT_EQ("321 bytes"s, sdimport::hr_bytes(UINT64_C(321)));
}

TEST(hr_bytes_suite, kb_no_decimals_test)
{
   ASSERT_EQ("12 KB"s, sdimport::hr_bytes(UINT64_C(12'004)));
   ASSERT_EQ("15 KB"s, sdimport::hr_bytes(UINT64_C(14'996)));
}

TEST(hr_bytes_suite, kb_one_decimal_test)
{
   ASSERT_EQ("12.1 KB"s, sdimport::hr_bytes(UINT64_C(12'102)));
   ASSERT_EQ("12.9 KB"s, sdimport::hr_bytes(UINT64_C(12'899)));
}

TEST(hr_bytes_suite, mb_two_decimals_test)
{
   ASSERT_EQ("12.01 MB"s, sdimport::hr_bytes(UINT64_C(12'012'123)));
   ASSERT_EQ("12.12 MB"s, sdimport::hr_bytes(UINT64_C(12'123'123)));
}

TEST(hr_bytes_suite, next_unit_rounding_test)
{
   ASSERT_EQ("1 MB"s, sdimport::hr_bytes(UINT64_C(999'999)));
}

TEST(hr_bytes_suite, tb_three_decimals_test)
{
   ASSERT_EQ("34.001 TB"s, sdimport::hr_bytes(UINT64_C(34'001'123'456'789)));
   ASSERT_EQ("34.232 TB"s, sdimport::hr_bytes(UINT64_C(34'231'823'456'789)));
}

TEST(fmt_rational_suite, denominator_decimals_test)
{
   ASSERT_EQ("-2.7"s, sdimport::fmt_rational(-27, 10));
   ASSERT_EQ("8.27"s, sdimport::fmt_rational(827, 100));
   ASSERT_EQ("10"s, sdimport::fmt_rational(10, 1));
}

TEST(fmt_rational_suite, trailing_zeros_test)
{
   ASSERT_EQ("0.3"s, sdimport::fmt_rational(30, 100));
   ASSERT_EQ("0"s, sdimport::fmt_rational(0, 10));
}

TEST(fmt_rational_suite, zero_denominator_test)
{
   ASSERT_THROW(sdimport::fmt_rational(1, 0), std::invalid_argument);
}

TEST(fmt_decimal_suite, negative_zero_test)
{
   ASSERT_EQ("0"s, sdimport::fmt_decimal(-0.01, 1));
   ASSERT_EQ("1.5"s, sdimport::fmt_decimal(1.50, 2));
}

}
}
