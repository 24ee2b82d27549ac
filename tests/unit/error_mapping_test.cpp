#include <faultline/error_mapping.hpp>
#include <catch2/catch_all.hpp>

#include <variant>

using namespace faultline;

TEST_CASE("io failures keep the std::error_code and path", "[errors][mapping]") {
  const auto ec = std::make_error_code(std::errc::permission_denied);
  auto e = core::to_error(ec, "/etc/shadow", "config.read");
  REQUIRE(e.component == "config.read");
  const auto* io = std::get_if<core::io_failure>(&e.kind);
  REQUIRE(io != nullptr);
  REQUIRE(io->cause == std::errc::permission_denied);
  REQUIRE(io->path == "/etc/shadow");
}

TEST_CASE("integer parse failures become Parse with the reason text", "[errors][mapping]") {
  auto e = core::to_error(core::int_parse_failure{core::int_parse_kind::pos_overflow, "70000"}, "config.port");
  const auto* p = std::get_if<core::parse_failure>(&e.kind);
  REQUIRE(p != nullptr);
  REQUIRE(p->reason == "number too large to fit in target type");
  REQUIRE(p->input == "70000");
  REQUIRE(e.component == "config.port");
}

TEST_CASE("float parse failures become ParseFloat", "[errors][mapping]") {
  auto e = core::to_error(core::float_parse_failure{core::float_parse_kind::invalid, "1.2.3"});
  const auto* p = std::get_if<core::parse_float_failure>(&e.kind);
  REQUIRE(p != nullptr);
  REQUIRE(p->reason == "invalid float literal");
  REQUIRE(p->input == "1.2.3");
  REQUIRE(e.component.empty());
}

TEST_CASE("domain errors become Domain with the same case", "[errors][mapping]") {
  for (auto d : {math::domain_error::division_by_zero, math::domain_error::negative_square_root,
                 math::domain_error::overflow}) {
    auto e = core::to_error(d);
    const auto* dom = std::get_if<core::domain_failure>(&e.kind);
    REQUIRE(dom != nullptr);
    REQUIRE(dom->cause == d);
  }
}

TEST_CASE("to_error on a core::error is the identity", "[errors][mapping]") {
  auto original = core::to_error(math::domain_error::overflow, "stage");
  auto again = core::to_error(original);
  REQUIRE(again.component == "stage");
  REQUIRE(std::get<core::domain_failure>(again.kind).cause == math::domain_error::overflow);
}
