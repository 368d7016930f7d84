#include <catch2/catch_test_macros.hpp>

#include "cricket/core/http.hpp"
#include "cricket/rankings/service.hpp"
#include "stub_transport.hpp"

#include <glaze/json/write.hpp>

#include <memory>
#include <string>

using namespace cricket;
using testing::StubTransport;

namespace {

std::size_t rowsOf(const glz::generic &Value) {
  const auto *Rows = core::json::asArray(&Value);
  REQUIRE(Rows != nullptr);
  return Rows->size();
}

} // namespace

TEST_CASE("Rankings degrade to empty lists", "[rankings]") {
  auto Transport = std::make_shared<StubTransport>();
  providers::IccRankingsClient Client(testing::testConfig(), Transport);

  SECTION("All four requests failing is still a success") {
    auto Result = rankings::fetchRankings(Client, "test");
    REQUIRE(Result);
    REQUIRE(Result->Format == "test");
    REQUIRE(rowsOf(Result->Teams) == 0);
    REQUIRE(rowsOf(Result->Players.Batting) == 0);
    REQUIRE(rowsOf(Result->Players.Bowling) == 0);
    REQUIRE(rowsOf(Result->Players.Allrounder) == 0);
    REQUIRE(Transport->Calls.size() == 4);

    std::string Json;
    REQUIRE_FALSE(glz::write<core::ResponseOpts>(*Result, Json));
    REQUIRE(
        Json ==
        R"({"format":"test","teams":[],"players":{"batting":[],"bowling":[],"allrounder":[]}})"
    );
  }

  SECTION("Successful slots are kept when others fail") {
    Transport->respond("https://icc.test/api/odi/men/teams", 200, R"([{"rank":1},{"rank":2}])");
    Transport->respond("https://icc.test/api/odi/men/bowling", 200, R"([{"rank":1}])");
    Transport->respond("https://icc.test/api/odi/men/batting", 503, "unavailable");

    auto Result = rankings::fetchRankings(Client, "odi");
    REQUIRE(Result);
    REQUIRE(rowsOf(Result->Teams) == 2);
    REQUIRE(rowsOf(Result->Players.Bowling) == 1);
    REQUIRE(rowsOf(Result->Players.Batting) == 0);
    REQUIRE(rowsOf(Result->Players.Allrounder) == 0);
  }

  SECTION("Requests cover teams and each player category") {
    REQUIRE(rankings::fetchRankings(Client, "t20"));
    REQUIRE(Transport->Calls.size() == 4);
    REQUIRE(Transport->Calls[0].Url == "https://icc.test/api/t20/men/teams");
    REQUIRE(Transport->Calls[1].Url == "https://icc.test/api/t20/men/batting");
    REQUIRE(Transport->Calls[2].Url == "https://icc.test/api/t20/men/bowling");
    REQUIRE(Transport->Calls[3].Url == "https://icc.test/api/t20/men/allrounder");
  }

  SECTION("Unknown format is a bad request") {
    auto Result = rankings::fetchRankings(Client, "hundred");
    REQUIRE_FALSE(Result);
    REQUIRE(Result.error().Status == 400);
    REQUIRE(Transport->Calls.empty());
  }
}
