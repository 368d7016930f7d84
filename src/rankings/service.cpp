#include "cricket/rankings/service.hpp"

#include "cricket/core/logging.hpp"

#include <format>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace cricket::rankings {

static glz::generic
fetchOrEmpty(providers::IccRankingsClient &Client, const std::string &Path) {
  auto Payload = Client.fetch(Path);
  if (!Payload) {
    core::logger(core::UpstreamLogger)
        ->warn(
            "Rankings {} unavailable ({}), using empty list", Path,
            Payload.error().Status
        );
    return core::json::emptyArray();
  }
  return std::move(*Payload);
}

auto fetchRankings(providers::IccRankingsClient &Client, std::string_view FormatParam)
    -> std::expected<RankingsResult, core::Error> {
  auto Parsed = parseFormat(FormatParam);
  if (!Parsed) {
    return std::unexpected(core::Error::badRequest(std::format(
        "format must be one of test, odi, t20 (got '{}')", FormatParam
    )));
  }
  auto Name = toString(*Parsed);

  RankingsResult Result{.Format = std::string(Name)};
  Result.Teams = fetchOrEmpty(Client, std::format("{}/men/teams", Name));

  for (auto Category : PlayerCategories) {
    auto Rows =
        fetchOrEmpty(Client, std::format("{}/men/{}", Name, Category));
    if (Category == "batting") {
      Result.Players.Batting = std::move(Rows);
    } else if (Category == "bowling") {
      Result.Players.Bowling = std::move(Rows);
    } else {
      Result.Players.Allrounder = std::move(Rows);
    }
  }

  spdlog::debug("Rankings {} assembled", Name);
  return Result;
}

} // namespace cricket::rankings
