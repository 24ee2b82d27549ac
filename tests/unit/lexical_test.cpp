#include <faultline/core/lexical.hpp>
#include <catch2/catch_all.hpp>

#include <cmath>

using namespace faultline::core;

TEST_CASE("parse_u16 accepts the full range", "[lexical]") {
  REQUIRE(parse_u16("0").value() == 0);
  REQUIRE(parse_u16("3000").value() == 3000);
  REQUIRE(parse_u16("65535").value() == 65535);
  REQUIRE(parse_u16("+80").value() == 80);
  REQUIRE(parse_u16("007").value() == 7);
}

TEST_CASE("parse_u16 failure kinds", "[lexical]") {
  REQUIRE(parse_u16("").error().kind == int_parse_kind::empty);
  REQUIRE(parse_u16("notanumber").error().kind == int_parse_kind::invalid_digit);
  REQUIRE(parse_u16("-1").error().kind == int_parse_kind::invalid_digit);
  REQUIRE(parse_u16("+").error().kind == int_parse_kind::invalid_digit);
  REQUIRE(parse_u16("12 3").error().kind == int_parse_kind::invalid_digit);
  REQUIRE(parse_u16("65536").error().kind == int_parse_kind::pos_overflow);
  REQUIRE(parse_u16("99999999999999999999").error().kind == int_parse_kind::pos_overflow);
  REQUIRE(parse_u16("abc").error().input == "abc");
}

TEST_CASE("parse_f64 grammar", "[lexical]") {
  REQUIRE(parse_f64("100").value() == 100.0);
  REQUIRE(parse_f64("-4").value() == -4.0);
  REQUIRE(parse_f64("+2.5").value() == 2.5);
  REQUIRE(parse_f64("1e3").value() == 1000.0);
  REQUIRE(parse_f64(".5").value() == 0.5);
  REQUIRE(std::isinf(parse_f64("inf").value()));
  REQUIRE(std::isinf(parse_f64("1e400").value()));
  REQUIRE(std::isnan(parse_f64("NaN").value()));

  REQUIRE(parse_f64("").error().kind == float_parse_kind::empty);
  REQUIRE(parse_f64("abc").error().kind == float_parse_kind::invalid);
  REQUIRE(parse_f64("1.2.3").error().kind == float_parse_kind::invalid);
  REQUIRE(parse_f64("+-1").error().kind == float_parse_kind::invalid);
  REQUIRE(parse_f64(" 1").error().kind == float_parse_kind::invalid);
}

TEST_CASE("parse_f64 accepts only a bare nan", "[lexical]") {
  REQUIRE(std::isnan(parse_f64("nan").value()));
  REQUIRE(std::isnan(parse_f64("-NAN").value()));
  REQUIRE(parse_f64("nan(123)").error().kind == float_parse_kind::invalid);
  REQUIRE(parse_f64("-nan(0x1)").error().kind == float_parse_kind::invalid);
  REQUIRE(parse_f64("+nan()").error().kind == float_parse_kind::invalid);
  REQUIRE(parse_f64("nanx").error().kind == float_parse_kind::invalid);
}

TEST_CASE("parse_bool is exact", "[lexical]") {
  REQUIRE(parse_bool("true") == true);
  REQUIRE(parse_bool("false") == false);
  REQUIRE_FALSE(parse_bool("True").has_value());
  REQUIRE_FALSE(parse_bool("1").has_value());
  REQUIRE_FALSE(parse_bool("").has_value());
}

TEST_CASE("trim strips ASCII whitespace", "[lexical]") {
  REQUIRE(trim("  a b \t\r\n") == "a b");
  REQUIRE(trim("") == "");
  REQUIRE(trim(" \t ") == "");
}

TEST_CASE("trim strips UTF-8 encoded Unicode whitespace", "[lexical]") {
  REQUIRE(trim("\xC2\xA0" "80") == "80");                       // no-break space
  REQUIRE(trim("80" "\xE3\x80\x80") == "80");                   // ideographic space
  REQUIRE(trim("\xE2\x80\x83 x \xE2\x80\xAF\xC2\x85") == "x");  // em space, narrow nbsp, NEL
  REQUIRE(trim("\xC2\xA0\xE2\x80\x8A") == "");
  // Non-whitespace multibyte characters are kept.
  REQUIRE(trim("\xC3\xA9t\xC3\xA9") == "\xC3\xA9t\xC3\xA9");
  REQUIRE(trim("\xE2\x80\x8B") == "\xE2\x80\x8B");           // zero-width space is not White_Space
}
