#pragma once
#include "cricket/core/config.hpp"
#include "cricket/core/transport.hpp"
#include "cricket/providers/clients.hpp"
#include "cricket/providers/fetchers.hpp"

#include "glaze/net/http_router.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string_view>

namespace cricket::server::dependencies {

// Everything a handler may touch, built once in main and shared read-only.
struct Dependencies {
  std::shared_ptr<const core::Config> Config;
  std::shared_ptr<core::Transport> Transport;
  std::shared_ptr<providers::MatchProvider> Matches;
  std::shared_ptr<providers::IccRankingsClient> Rankings;
  std::shared_ptr<providers::TwitterClient> Twitter;

  static std::shared_ptr<Dependencies> create(
      std::shared_ptr<const core::Config> Config,
      std::shared_ptr<core::Transport> Transport
  ) {
    auto Deps = std::make_shared<Dependencies>();
    Deps->Matches = providers::makeMatchProvider(*Config, Transport);
    Deps->Rankings =
        std::make_shared<providers::IccRankingsClient>(*Config, Transport);
    Deps->Twitter =
        std::make_shared<providers::TwitterClient>(*Config, Transport);
    Deps->Config = std::move(Config);
    Deps->Transport = std::move(Transport);
    return Deps;
  }
};

inline bool isMatchId(std::string_view Value) {
  return !Value.empty() && std::ranges::all_of(Value, [](unsigned char Ch) {
    return std::isalnum(Ch) || Ch == '-' || Ch == '_';
  });
}

inline glz::param_constraint matchIdConstraint() {
  glz::param_constraint MatchId{
      .description = "Must be a provider match id ([A-Za-z0-9_-]+)",
      .validation = [](std::string_view Value) { return isMatchId(Value); }
  };
  return MatchId;
}

} // namespace cricket::server::dependencies
