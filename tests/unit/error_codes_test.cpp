#include <quiver/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using quiver::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::validation_failed) == 10001u);
  REQUIRE(static_cast<unsigned>(error_code::index_unavailable) == 10005u);
}

TEST_CASE("error code names", "[errors]") {
  using quiver::core::error_code;
  using quiver::core::to_string;
  REQUIRE(to_string(error_code::missing_vector) == "missing_vector");
  REQUIRE(to_string(error_code::index_inconsistency) == "index_inconsistency");
  REQUIRE(to_string(error_code::timeout) == "timeout");
  REQUIRE(to_string(error_code::config_invalid) == "config_invalid");
  STATIC_REQUIRE(to_string(error_code::not_found) == "not_found");
}
