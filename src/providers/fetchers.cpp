#include "cricket/providers/fetchers.hpp"

#include "cricket/core/json.hpp"
#include "cricket/core/logging.hpp"
#include "cricket/core/url.hpp"
#include "cricket/matches/normalize.hpp"

#include <format>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace cricket::providers {

static auto Log() { return core::logger(core::UpstreamLogger); }

SportmonksProvider::SportmonksProvider(
    const core::Config &Config, std::shared_ptr<core::Transport> Transport
)
    : Client(Config, std::move(Transport)) {}

auto SportmonksProvider::listMatches(matches::MatchType Type)
    -> std::expected<std::vector<matches::MatchSummary>, core::Error> {
  auto Payload = Client.fetch(
      matches::sportmonks::listPath(Type),
      {{"include", std::string(matches::sportmonks::ListIncludes)}}
  );
  if (!Payload) {
    return std::unexpected(Payload.error());
  }

  auto Records = matches::sportmonks::extractList(*Payload);
  Log()->debug(
      "sportmonks {} returned {} records", matches::toString(Type),
      Records.size()
  );

  std::vector<matches::MatchSummary> Summaries;
  Summaries.reserve(Records.size());
  for (const auto &Record : Records) {
    Summaries.push_back(matches::sportmonks::toSummary(Record, Type));
  }
  return Summaries;
}

auto SportmonksProvider::matchDetail(std::string_view MatchId)
    -> std::expected<std::string, core::Error> {
  return Client.fetchRaw(
      std::format("fixtures/{}", core::percentEncode(MatchId)),
      {{"include", std::string(matches::sportmonks::DetailIncludes)}}
  );
}

CricbuzzProvider::CricbuzzProvider(
    const core::Config &Config, std::shared_ptr<core::Transport> Transport
)
    : Client(Config, std::move(Transport)) {}

auto CricbuzzProvider::listMatches(matches::MatchType Type)
    -> std::expected<std::vector<matches::MatchSummary>, core::Error> {
  auto Payload = Client.fetch(matches::cricbuzz::listPath(Type));
  if (!Payload) {
    return std::unexpected(Payload.error());
  }

  auto Records = matches::cricbuzz::extractList(*Payload);
  if (Records.empty() && core::json::asArray(&*Payload) == nullptr &&
      core::json::member(*Payload, "matches") == nullptr) {
    Log()->warn(
        "rapidapi {} payload has no match list", matches::toString(Type)
    );
  }

  std::vector<matches::MatchSummary> Summaries;
  Summaries.reserve(Records.size());
  for (const auto &Record : Records) {
    Summaries.push_back(matches::cricbuzz::toSummary(Record, Type));
  }
  return Summaries;
}

auto CricbuzzProvider::matchDetail(std::string_view MatchId)
    -> std::expected<std::string, core::Error> {
  return Client.fetchRaw(
      std::format("mcenter/v1/{}", core::percentEncode(MatchId))
  );
}

auto makeMatchProvider(
    const core::Config &Config, std::shared_ptr<core::Transport> Transport
) -> std::shared_ptr<MatchProvider> {
  switch (Config.ActiveProvider) {
  case core::Provider::Cricbuzz:
    return std::make_shared<CricbuzzProvider>(Config, std::move(Transport));
  case core::Provider::Sportmonks:
    break;
  }
  return std::make_shared<SportmonksProvider>(Config, std::move(Transport));
}

} // namespace cricket::providers
