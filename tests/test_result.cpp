#include <catch2/catch_test_macros.hpp>

#include "cricket/core/result.hpp"

#include <string>

using namespace cricket;

TEST_CASE("Error constructors set kind and status", "[result]") {
  auto NotConfigured = core::Error::notConfigured("X_BEARER_TOKEN not configured");
  REQUIRE(NotConfigured.Kind == core::ErrorKind::ProviderNotConfigured);
  REQUIRE(NotConfigured.Status == 501);

  auto Upstream = core::Error::upstream(403, std::string(500, 'x'));
  REQUIRE(Upstream.Kind == core::ErrorKind::UpstreamError);
  REQUIRE(Upstream.Status == 403);
  // Upstream bodies are never cut.
  REQUIRE(Upstream.Message.size() == 500);

  REQUIRE(core::Error::badRequest("bad").Status == 400);
  REQUIRE(core::Error::unreachable("refused").Status == 500);
  REQUIRE(core::Error::internal("boom").Kind == core::ErrorKind::Internal);
}

TEST_CASE("Messages are truncated to 200 bytes", "[result]") {
  auto Long = std::string(300, 'a');
  REQUIRE(core::Error::unreachable(Long).Message.size() == 200);
  REQUIRE(core::Error::internal(Long).Message.size() == 200);
  REQUIRE(core::truncateMessage("short") == "short");

  SECTION("A multi-byte sequence on the boundary is dropped whole") {
    // 199 ASCII bytes followed by a two-byte character straddling byte 200.
    auto Text = std::string(199, 'a') + "\xC3\xA9" + "tail";
    auto Cut = core::truncateMessage(Text);
    REQUIRE(Cut.size() == 199);
    REQUIRE(Cut == std::string(199, 'a'));
  }

  SECTION("A sequence ending exactly at the limit is kept") {
    auto Text = std::string(198, 'a') + "\xC3\xA9" + "tail";
    auto Cut = core::truncateMessage(Text);
    REQUIRE(Cut.size() == 200);
  }
}
