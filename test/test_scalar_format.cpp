#include "encoder/scalar_format.hpp"
#include "runtime/error.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace tomlenc;

TEST(scalar_format, plain_string_is_quoted) {
  EXPECT_EQ(format_string("hello"), R"("hello")");
  EXPECT_EQ(format_string(""), R"("")");
}

TEST(scalar_format, quote_and_backslash_are_escaped) {
  EXPECT_EQ(format_string(R"(a"b)"), R"("a\"b")");
  EXPECT_EQ(format_string(R"(a\b)"), R"("a\\b")");
}

TEST(scalar_format, short_escapes_for_newline_return_and_tab) {
  EXPECT_EQ(format_string("a\nb"), R"("a\nb")");
  EXPECT_EQ(format_string("a\rb"), R"("a\rb")");
  EXPECT_EQ(format_string("a\tb"), R"("a\tb")");
}

TEST(scalar_format, control_bytes_use_unicode_escapes) {
  EXPECT_EQ(format_string("\x01"), R"("\u0001")");
  EXPECT_EQ(format_string("a\x1f"), R"("a\u001f")");
  EXPECT_EQ(format_string("\x7f"), R"("\u007f")");
}

TEST(scalar_format, literal_backslash_x_is_not_a_byte_escape) {
  EXPECT_EQ(format_string(R"(\x64)"), R"("\\x64")");
  EXPECT_EQ(format_string(R"(\u0064)"), R"("\\u0064")");
  EXPECT_EQ(format_string(R"(\\x64)"), R"("\\\\x64")");
}

TEST(scalar_format, backslash_before_control_byte) {
  EXPECT_EQ(format_string("\\\x01"), R"("\\\u0001")");
}

TEST(scalar_format, utf8_passes_through) {
  EXPECT_EQ(format_string("\xc3\xa9t\xc3\xa9"), "\"\xc3\xa9t\xc3\xa9\"");
  EXPECT_EQ(format_string("\xe2\x82\xac"), "\"\xe2\x82\xac\"");
  EXPECT_EQ(format_string("\xf0\x9f\x98\x80"), "\"\xf0\x9f\x98\x80\"");
}

TEST(scalar_format, invalid_utf8_is_rejected) {
  EXPECT_THROW(format_string("\xff\xfe"), configuration_error);
  EXPECT_THROW(format_string("a\xc3"), configuration_error);
  EXPECT_THROW(format_string("\xc3("), configuration_error);
  EXPECT_THROW(format_string("\xc0\xaf"), configuration_error);
  EXPECT_THROW(format_string("\xed\xa0\x80"), configuration_error);
  EXPECT_THROW(format_string("\xf4\x90\x80\x80"), configuration_error);
  EXPECT_THROW(format_key("\x80"), configuration_error);
}

TEST(scalar_format, booleans) {
  EXPECT_EQ(format_bool(true), "true");
  EXPECT_EQ(format_bool(false), "false");
}

TEST(scalar_format, integers) {
  EXPECT_EQ(format_integer(0), "0");
  EXPECT_EQ(format_integer(42), "42");
  EXPECT_EQ(format_integer(-17), "-17");
  EXPECT_EQ(format_integer(std::numeric_limits<std::int64_t>::max()),
            "9223372036854775807");
  EXPECT_EQ(format_integer(std::numeric_limits<std::int64_t>::min()),
            "-9223372036854775808");
}

TEST(scalar_format, floats_always_read_as_floats) {
  EXPECT_EQ(format_float(1.0), "1.0");
  EXPECT_EQ(format_float(-2.0), "-2.0");
  EXPECT_EQ(format_float(0.0), "0.0");
  EXPECT_EQ(format_float(3.14), "3.14");
  EXPECT_EQ(format_float(0.1), "0.1");
  EXPECT_EQ(format_float(1e15), "1000000000000000.0");
}

TEST(scalar_format, float_exponent_has_no_leading_zero) {
  EXPECT_EQ(format_float(1e-05), "1e-5");
  EXPECT_EQ(format_float(2.5e-07), "2.5e-7");
  EXPECT_EQ(format_float(1e16), "1e+16");
  EXPECT_EQ(format_float(1e100), "1e+100");
}

TEST(scalar_format, special_floats) {
  EXPECT_EQ(format_float(std::numeric_limits<double>::quiet_NaN()), "nan");
  EXPECT_EQ(format_float(std::numeric_limits<double>::infinity()), "inf");
  EXPECT_EQ(format_float(-std::numeric_limits<double>::infinity()), "-inf");
}

TEST(scalar_format, single_precision_uses_shortest_float_digits) {
  EXPECT_EQ(format_single_float(0.1f), "0.1");
  EXPECT_EQ(format_single_float(2.0f), "2.0");
  EXPECT_EQ(format_single_float(std::numeric_limits<float>::infinity()), "inf");
}

TEST(scalar_format, strip_exponent_zeros) {
  EXPECT_EQ(strip_exponent_zeros("1e-05"), "1e-5");
  EXPECT_EQ(strip_exponent_zeros("1E+007"), "1E+7");
  EXPECT_EQ(strip_exponent_zeros("1e00"), "1e0");
  EXPECT_EQ(strip_exponent_zeros("1e10"), "1e10");
  EXPECT_EQ(strip_exponent_zeros("2.5"), "2.5");
}

TEST(scalar_format, decimals) {
  EXPECT_EQ(format_decimal(decimal{"1e+05"}), "1e+5");
  EXPECT_EQ(format_decimal(decimal{"3"}), "3.0");
  EXPECT_EQ(format_decimal(decimal{"-3.25"}), "-3.25");
  EXPECT_EQ(format_decimal(decimal{".5"}), "0.5");
  EXPECT_EQ(format_decimal(decimal{"5."}), "5.0");
  EXPECT_EQ(format_decimal(decimal{"007.25"}), "7.25");
  EXPECT_EQ(format_decimal(decimal{"1.5E-003"}), "1.5E-3");
}

TEST(scalar_format, special_decimals) {
  EXPECT_EQ(format_decimal(decimal{"Infinity"}), "inf");
  EXPECT_EQ(format_decimal(decimal{"-Infinity"}), "-inf");
  EXPECT_EQ(format_decimal(decimal{"NaN"}), "nan");
}

TEST(scalar_format, dates_and_times) {
  EXPECT_EQ(format_date(make_date(1979, 5, 27)), "1979-05-27");
  EXPECT_EQ(format_time(make_time(7, 32, 0)), "07:32:00");
  EXPECT_EQ(format_time(make_time(0, 32, 0, 999999)), "00:32:00.999999");
  EXPECT_EQ(format_time(make_time(7, 32, 0, 0, make_offset(2))), "07:32:00");
}

TEST(scalar_format, date_times) {
  local_date d = make_date(1979, 5, 27);

  EXPECT_EQ(format_date_time(make_date_time(d, make_time(7, 32, 0))),
            "1979-05-27T07:32:00");
  EXPECT_EQ(format_date_time(make_date_time(d, make_time(7, 32, 0, 0, make_offset(0)))),
            "1979-05-27T07:32:00Z");
  EXPECT_EQ(format_date_time(make_date_time(d, make_time(0, 32, 0, 999999,
                                                         make_offset(-7)))),
            "1979-05-27T00:32:00.999999-07:00");
  EXPECT_EQ(format_date_time(make_date_time(d, make_time(7, 32, 0, 0,
                                                         make_offset(5, 30)))),
            "1979-05-27T07:32:00+05:30");
}

TEST(scalar_format, bare_keys) {
  EXPECT_TRUE(is_bare_key("key"));
  EXPECT_TRUE(is_bare_key("bare_key-1"));
  EXPECT_TRUE(is_bare_key("1234"));
  EXPECT_FALSE(is_bare_key(""));
  EXPECT_FALSE(is_bare_key("a b"));
  EXPECT_FALSE(is_bare_key("a.b"));
  EXPECT_FALSE(is_bare_key("\xc3\xa9"));
}

TEST(scalar_format, keys_are_quoted_unless_bare) {
  EXPECT_EQ(format_key("key"), "key");
  EXPECT_EQ(format_key("a b"), R"("a b")");
  EXPECT_EQ(format_key(""), R"("")");
  EXPECT_EQ(format_key(R"(quote"d)"), R"("quote\"d")");
}
