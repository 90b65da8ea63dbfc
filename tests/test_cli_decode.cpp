#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "decode_logic.h"
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace sfid;

TEST_CASE("execute_decode prints the fields of each identifier", "[cli][decode]") {
  std::ostringstream out;
  std::ostringstream err;

  const std::vector<std::string> inputs{"4194304007", "0x00000000fa000007"};
  REQUIRE(cli::execute_decode(inputs, {}, out, err) == 0);
  CHECK(err.str().empty());

  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    const auto j = nlohmann::json::parse(line);
    CHECK(j.at("id").get<std::string>() == "4194304007");
    CHECK(j.at("timestamp_ms").get<std::uint64_t>() == 1000);
    CHECK(j.at("random").get<std::uint64_t>() == 7);
    ++count;
  }
  CHECK(count == 2);
}

TEST_CASE("execute_decode skips invalid input and fails", "[cli][decode][errors]") {
  std::ostringstream out;
  std::ostringstream err;

  const std::vector<std::string> inputs{"bogus", "4194304007"};
  CHECK(cli::execute_decode(inputs, {}, out, err) == 1);
  CHECK(err.str().find("bogus") != std::string::npos);
  CHECK(out.str().find("4194304007") != std::string::npos);
}

TEST_CASE("execute_decode can require the generated layout", "[cli][decode]") {
  const std::vector<std::string> inputs{"0x8000000000000000", "0x200000", "4194304007"};

  SECTION("accepted by default") {
    std::ostringstream out;
    std::ostringstream err;
    CHECK(cli::execute_decode(inputs, {}, out, err) == 0);
  }

  SECTION("rejected on request") {
    std::ostringstream out;
    std::ostringstream err;
    cli::DecodeOptions options;
    options.require_generated_layout = true;

    CHECK(cli::execute_decode(inputs, options, out, err) == 1);
    CHECK(err.str().find("sign=1") != std::string::npos);
    CHECK(err.str().find("separator=1") != std::string::npos);
    CHECK(out.str().find("4194304007") != std::string::npos);
  }
}
