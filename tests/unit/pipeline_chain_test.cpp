#include <faultline/pipeline/chain.hpp>
#include <faultline/core/lexical.hpp>
#include <faultline/math/domain_ops.hpp>
#include <catch2/catch_all.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace faultline;

TEST_CASE("chain with no steps is the identity", "[pipeline]") {
  auto r = pipeline::chain(42);
  REQUIRE(r.has_value());
  REQUIRE(*r == 42);

  auto s = pipeline::chain(std::string("abc"));
  REQUIRE(s.value() == "abc");
}

TEST_CASE("chain with one step returns that step's value", "[pipeline]") {
  auto r = pipeline::chain(16.0, [](double x){ return math::sqrt(x); });
  REQUIRE(r.value() == 4.0);
}

TEST_CASE("chain passes each success value to the next step", "[pipeline]") {
  std::vector<int> order;
  auto r = pipeline::chain(std::string_view("100"),
      [&](std::string_view s){ order.push_back(1); return core::parse_f64(s); },
      [&](double x){ order.push_back(2); return math::sqrt(x); },
      [&](double x){ order.push_back(3); return math::divide(x, 10.0); });
  REQUIRE(r.value() == 1.0);
  REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("chain stops at the first failure and converts it", "[pipeline]") {
  int third_calls = 0;
  auto r = pipeline::chain(-4.0,
      [](double x) -> std::expected<double, math::domain_error> { return x; },
      [](double x){ return math::sqrt(x); },
      [&](double x){ ++third_calls; return math::divide(x, 10.0); });
  REQUIRE_FALSE(r.has_value());
  REQUIRE(third_calls == 0);
  const auto* d = std::get_if<core::domain_failure>(&r.error().kind);
  REQUIRE(d != nullptr);
  REQUIRE(d->cause == math::domain_error::negative_square_root);
}

TEST_CASE("chain converts failures from heterogeneous step types", "[pipeline]") {
  int later_calls = 0;
  auto r = pipeline::chain(std::string_view("abc"),
      [](std::string_view s){ return core::parse_f64(s); },
      [&](double x){ ++later_calls; return math::sqrt(x); });
  REQUIRE(later_calls == 0);
  REQUIRE(core::code_of(r.error()) == core::error_code::parse_float);
}

TEST_CASE("chain leaves core::error failures untouched", "[pipeline]") {
  auto r = pipeline::chain(1,
      [](int) -> std::expected<int, core::error> {
        return std::unexpected(core::to_error(math::domain_error::overflow, "custom.stage"));
      });
  REQUIRE(r.error().component == "custom.stage");
}

TEST_CASE("chain can change the value type at each step", "[pipeline]") {
  auto r = pipeline::chain(std::string("  9 "),
      [](const std::string& s) -> std::expected<std::string_view, core::error> { return core::trim(s); },
      [](std::string_view s){ return core::parse_u16(s); },
      [](std::uint16_t v) -> std::expected<double, core::error> { return static_cast<double>(v); },
      [](double x){ return math::sqrt(x); });
  REQUIRE(r.value() == 3.0);
}

TEST_CASE("storage-style steps convert std::error_code with their path", "[pipeline]") {
  int later_calls = 0;
  auto r = pipeline::chain(std::string("cfg.txt"),
      [](const std::string& path) -> std::expected<std::string, core::error> {
        const auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return std::unexpected(core::to_error(ec, path, "read"));
      },
      [&](const std::string& s){ ++later_calls; return core::parse_f64(s); });
  REQUIRE(later_calls == 0);
  REQUIRE(core::is_not_found(r.error()));
  REQUIRE(std::get<core::io_failure>(r.error().kind).path == "cfg.txt");
}

TEST_CASE("step_sequence of length 0 returns the input", "[pipeline]") {
  pipeline::step_sequence<double> seq;
  REQUIRE(seq.size() == 0);
  REQUIRE(seq.run(7.5).value() == 7.5);
}

TEST_CASE("step_sequence short-circuits on the failing step", "[pipeline]") {
  int calls[3] = {0, 0, 0};
  pipeline::step_sequence<double> seq;
  seq.then([&](double x) -> std::expected<double, core::error> { ++calls[0]; return x - 10.0; })
     .then([&](double x) -> std::expected<double, core::error> {
        ++calls[1];
        auto r = math::sqrt(x);
        if (!r) return std::unexpected(core::to_error(r.error(), "step2"));
        return *r;
      })
     .then([&](double x) -> std::expected<double, core::error> { ++calls[2]; return x * 2.0; });
  REQUIRE(seq.size() == 3);

  auto bad = seq.run(1.0);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().component == "step2");
  REQUIRE(std::get<core::domain_failure>(bad.error().kind).cause == math::domain_error::negative_square_root);
  REQUIRE(calls[0] == 1);
  REQUIRE(calls[1] == 1);
  REQUIRE(calls[2] == 0);

  auto good = seq.run(26.0);
  REQUIRE(good.value() == 8.0);
  REQUIRE(calls[2] == 1);
}

TEST_CASE("step_sequence handles long chains", "[pipeline]") {
  pipeline::step_sequence<int> seq;
  for (int i = 0; i < 1000; ++i) seq.then([](int x) -> std::expected<int, core::error> { return x + 1; });
  REQUIRE(seq.run(0).value() == 1000);
}
