#include "faultline/core/lexical.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace faultline::core {

auto to_string(int_parse_kind k) -> std::string_view {
  switch (k) {
    case int_parse_kind::empty: return "cannot parse integer from empty string";
    case int_parse_kind::invalid_digit: return "invalid digit found in string";
    case int_parse_kind::pos_overflow: return "number too large to fit in target type";
  }
  return "invalid integer";
}

auto to_string(float_parse_kind k) -> std::string_view {
  switch (k) {
    case float_parse_kind::empty: return "cannot parse float from empty string";
    case float_parse_kind::invalid: return "invalid float literal";
  }
  return "invalid float literal";
}

namespace {

// Byte length of the whitespace code point starting at `pos`, 0 if there is none.
// Covers ASCII whitespace and the UTF-8 encoded Unicode White_Space characters.
auto ws_width(std::string_view s, std::size_t pos) noexcept -> std::size_t {
  const auto at = [&](std::size_t i) { return static_cast<unsigned char>(s[pos + i]); };
  const std::size_t left = s.size() - pos;
  if (left == 0) return 0;
  const unsigned char c = at(0);
  if (c == ' ' || (c >= 0x09 && c <= 0x0D)) return 1;
  if (left >= 2 && c == 0xC2 && (at(1) == 0x85 || at(1) == 0xA0)) return 2;
  if (left < 3) return 0;
  const unsigned char c1 = at(1), c2 = at(2);
  if (c == 0xE1 && c1 == 0x9A && c2 == 0x80) return 3;                        // U+1680
  if (c == 0xE2 && c1 == 0x80 && ((c2 >= 0x80 && c2 <= 0x8A) ||               // U+2000..U+200A
                                  c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF)) {  // U+2028 U+2029 U+202F
    return 3;
  }
  if (c == 0xE2 && c1 == 0x81 && c2 == 0x9F) return 3;                        // U+205F
  if (c == 0xE3 && c1 == 0x80 && c2 == 0x80) return 3;                        // U+3000
  return 0;
}

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    char ca = a[i];
    if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
    if (ca != b[i]) return false;
  }
  return true;
}

} // namespace

auto trim(std::string_view s) noexcept -> std::string_view {
  while (auto n = ws_width(s, 0)) s.remove_prefix(n);
  for (bool again = true; again && !s.empty();) {
    again = false;
    for (std::size_t n = 1; n <= 3 && n <= s.size(); ++n) {
      if (ws_width(s, s.size() - n) == n) { s.remove_suffix(n); again = true; break; }
    }
  }
  return s;
}

auto parse_u16(std::string_view text) -> std::expected<std::uint16_t, int_parse_failure> {
  if (text.empty()) {
    return std::unexpected(int_parse_failure{int_parse_kind::empty, std::string(text)});
  }
  std::string_view digits = text;
  if (digits.front() == '+') digits.remove_prefix(1);
  if (digits.empty()) {
    return std::unexpected(int_parse_failure{int_parse_kind::invalid_digit, std::string(text)});
  }
  // Digits are validated up front so that overflow is only reported for well-formed input.
  for (char c : digits) {
    if (c < '0' || c > '9') {
      return std::unexpected(int_parse_failure{int_parse_kind::invalid_digit, std::string(text)});
    }
  }
  std::uint16_t value = 0;
  const char* beg = digits.data();
  const char* end = beg + digits.size();
  auto [ptr, ec] = std::from_chars(beg, end, value, 10);
  if (ec == std::errc::result_out_of_range) {
    return std::unexpected(int_parse_failure{int_parse_kind::pos_overflow, std::string(text)});
  }
  if (ec != std::errc() || ptr != end) {
    return std::unexpected(int_parse_failure{int_parse_kind::invalid_digit, std::string(text)});
  }
  return value;
}

auto parse_f64(std::string_view text) -> std::expected<double, float_parse_failure> {
  if (text.empty()) {
    return std::unexpected(float_parse_failure{float_parse_kind::empty, std::string(text)});
  }
  std::string_view body = text;
  if (body.front() == '+') {
    body.remove_prefix(1);
    // from_chars does not take '+'; a second sign after it is still invalid.
    if (body.empty() || body.front() == '+' || body.front() == '-') {
      return std::unexpected(float_parse_failure{float_parse_kind::invalid, std::string(text)});
    }
  }
  // from_chars also takes the C form nan(n-char-sequence); only a bare nan is a literal.
  {
    std::string_view unsigned_body = body;
    if (!unsigned_body.empty() && unsigned_body.front() == '-') unsigned_body.remove_prefix(1);
    if (!unsigned_body.empty() && (unsigned_body.front() == 'n' || unsigned_body.front() == 'N') &&
        !iequals(unsigned_body, "nan")) {
      return std::unexpected(float_parse_failure{float_parse_kind::invalid, std::string(text)});
    }
  }
  double value = 0.0;
  const char* beg = body.data();
  const char* end = beg + body.size();
  auto [ptr, ec] = std::from_chars(beg, end, value, std::chars_format::general);
  if (ptr != end || (ec != std::errc() && ec != std::errc::result_out_of_range)) {
    return std::unexpected(float_parse_failure{float_parse_kind::invalid, std::string(text)});
  }
  if (ec == std::errc::result_out_of_range) {
    // Well-formed but not representable: saturate to inf or flush toward zero like strtod.
    const std::string copy(body);
    return std::strtod(copy.c_str(), nullptr);
  }
  return value;
}

auto parse_bool(std::string_view text) noexcept -> std::optional<bool> {
  if (text == "true") return true;
  if (text == "false") return false;
  return std::nullopt;
}

} // namespace faultline::core
