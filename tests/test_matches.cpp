#include <catch2/catch_test_macros.hpp>

#include "cricket/core/json.hpp"
#include "cricket/matches/service.hpp"
#include "cricket/providers/fetchers.hpp"
#include "stub_transport.hpp"

#include <memory>
#include <string>
#include <variant>

using namespace cricket;
using testing::StubTransport;

namespace {

constexpr const char *SportmonksLive = R"({"data":[
  {"id": 1, "status": "1st Innings", "localteam": {"id": 10, "name": "India", "code": "IND"}},
  {"id": 2, "status": null, "visitorteam": {"id": 11, "name": "Australia", "code": "AUS"}}
]})";

} // namespace

TEST_CASE("Match list through the primary provider", "[matches]") {
  auto Transport = std::make_shared<StubTransport>();
  auto Cfg = testing::testConfig();
  Cfg.CricketApiKey = "k";
  providers::SportmonksProvider Provider(Cfg, Transport);

  SECTION("Every summary has a non-empty upper-case status") {
    Transport->respond("https://sm.test/api/v2.0/livescores", 200, SportmonksLive);
    auto Result = matches::listMatches(Provider, "live");
    REQUIRE(Result);
    REQUIRE(Result->Type == "live");
    REQUIRE(Result->Matches.size() == 2);
    REQUIRE(Result->Matches[0].Status == "1ST INNINGS");
    REQUIRE(Result->Matches[1].Status == "LIVE");
    REQUIRE(Result->Matches[0].LocalTeam.Name == "India");
  }

  SECTION("The include list is sent with list requests") {
    Transport->respond("https://sm.test/api/v2.0/fixtures/finished", 200, R"({"data":[]})");
    auto Result = matches::listMatches(Provider, "completed");
    REQUIRE(Result);
    REQUIRE(Result->Matches.empty());
    REQUIRE(
        Transport->Calls.front().Url ==
        "https://sm.test/api/v2.0/fixtures/finished"
        "?include=localteam%2Cvisitorteam%2Cvenue%2Cseason&api_token=k"
    );
  }

  SECTION("Unknown type is rejected without contacting the provider") {
    auto Result = matches::listMatches(Provider, "archived");
    REQUIRE_FALSE(Result);
    REQUIRE(Result.error().Status == 400);
    REQUIRE(Result.error().Kind == core::ErrorKind::BadRequest);
    REQUIRE(Transport->Calls.empty());
  }

  SECTION("Upstream failure is propagated unchanged") {
    Transport->respond("https://sm.test/api/v2.0/fixtures", 401, R"({"error":"bad token"})");
    auto Result = matches::listMatches(Provider, "upcoming");
    REQUIRE_FALSE(Result);
    REQUIRE(Result.error().Status == 401);
    REQUIRE(Result.error().Message == R"({"error":"bad token"})");
  }
}

TEST_CASE("Match list through the alternate provider", "[matches]") {
  auto Transport = std::make_shared<StubTransport>();
  auto Cfg = testing::testConfig();
  Cfg.RapidApiKey = "rk";
  Cfg.RapidApiHost = "cb.test";
  providers::CricbuzzProvider Provider(Cfg, Transport);

  SECTION("matches array is normalized") {
    Transport->respond(
        "https://cb.test/matches/v1/upcoming", 200,
        R"({"matches":[{"matchId": 5, "seriesName": "IPL"}]})"
    );
    auto Result = matches::listMatches(Provider, "upcoming");
    REQUIRE(Result);
    REQUIRE(Result->Matches.size() == 1);
    REQUIRE(Result->Matches[0].Status == "UPCOMING");
    REQUIRE(Result->Matches[0].Note == "IPL");
  }

  SECTION("An object without a match list is an empty success") {
    Transport->respond("https://cb.test/matches/v1/recent", 200, R"({"typeMatches":[]})");
    auto Result = matches::listMatches(Provider, "completed");
    REQUIRE(Result);
    REQUIRE(Result->Matches.empty());
  }

  SECTION("Missing credentials give 501 and no request") {
    auto Bare = testing::testConfig();
    providers::CricbuzzProvider Unconfigured(Bare, Transport);
    auto Result = matches::listMatches(Unconfigured, "live");
    REQUIRE_FALSE(Result);
    REQUIRE(Result.error().Status == 501);
    REQUIRE(Transport->Calls.empty());
  }
}

TEST_CASE("Match detail is passed through", "[matches]") {
  auto Transport = std::make_shared<StubTransport>();
  auto Cfg = testing::testConfig();
  Cfg.CricketApiKey = "k";
  Cfg.RapidApiKey = "rk";
  Cfg.RapidApiHost = "cb.test";

  SECTION("Primary provider fixture detail") {
    Transport->respond(
        "https://sm.test/api/v2.0/fixtures/4242", 200,
        R"({"data":{"id":4242,"batting":[]}})"
    );
    providers::SportmonksProvider Provider(Cfg, Transport);
    auto Detail = matches::matchDetail(Provider, "4242");
    REQUIRE(Detail);
    auto Parsed = testing::parseJson(*Detail);
    REQUIRE(std::holds_alternative<core::json::Object>(Parsed.data));
    REQUIRE(core::json::member(Parsed, "data") != nullptr);
    REQUIRE(
        Transport->Calls.front().Url.find("include=localteam%2Cvisitorteam%2Cvenue%2Cruns")
        != std::string::npos
    );
  }

  SECTION("Alternate provider match center") {
    Transport->respond("https://cb.test/mcenter/v1/35612", 200, R"({"matchInfo":{}})");
    providers::CricbuzzProvider Provider(Cfg, Transport);
    auto Detail = matches::matchDetail(Provider, "35612");
    REQUIRE(Detail);
    REQUIRE(*Detail == R"({"matchInfo":{}})");
  }

  SECTION("Large ids and key order survive untouched") {
    constexpr auto Body =
        R"({"zeta":1,"alpha":{"id":9007199254740993,"b":2,"a":1}})";
    Transport->respond("https://cb.test/mcenter/v1/77", 200, Body);
    providers::CricbuzzProvider Provider(Cfg, Transport);
    auto Detail = matches::matchDetail(Provider, "77");
    REQUIRE(Detail);
    REQUIRE(*Detail == Body);
  }

  SECTION("A detail body that is not JSON is an internal error") {
    Transport->respond("https://cb.test/mcenter/v1/78", 200, "<html>maintenance</html>");
    providers::CricbuzzProvider Provider(Cfg, Transport);
    auto Detail = matches::matchDetail(Provider, "78");
    REQUIRE_FALSE(Detail);
    REQUIRE(Detail.error().Status == 500);
  }

  SECTION("Unknown id surfaces the provider's 404") {
    Transport->respond("https://sm.test/api/v2.0/fixtures/1", 404, "Not Found");
    providers::SportmonksProvider Provider(Cfg, Transport);
    auto Detail = matches::matchDetail(Provider, "1");
    REQUIRE_FALSE(Detail);
    REQUIRE(Detail.error().Status == 404);
    REQUIRE(Detail.error().Message == "Not Found");
  }

  SECTION("Empty id is a bad request") {
    providers::SportmonksProvider Provider(Cfg, Transport);
    REQUIRE(matches::matchDetail(Provider, "").error().Status == 400);
    REQUIRE(Transport->Calls.empty());
  }
}

TEST_CASE("Provider selection follows configuration", "[matches]") {
  auto Transport = std::make_shared<StubTransport>();
  auto Cfg = testing::testConfig();

  Cfg.ActiveProvider = core::Provider::Sportmonks;
  REQUIRE(providers::makeMatchProvider(Cfg, Transport)->name() == "sportmonks");

  Cfg.ActiveProvider = core::Provider::Cricbuzz;
  REQUIRE(providers::makeMatchProvider(Cfg, Transport)->name() == "rapidapi");
}
