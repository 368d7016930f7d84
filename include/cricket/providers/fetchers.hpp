#pragma once
#include "cricket/core/config.hpp"
#include "cricket/core/result.hpp"
#include "cricket/core/transport.hpp"
#include "cricket/matches/models.hpp"
#include "cricket/providers/clients.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cricket::providers {

class MatchListFetcher {
public:
  virtual ~MatchListFetcher() = default;

  virtual auto listMatches(matches::MatchType Type)
      -> std::expected<std::vector<matches::MatchSummary>, core::Error> = 0;
};

// Detail payloads are the provider's JSON text, byte for byte.
class MatchDetailFetcher {
public:
  virtual ~MatchDetailFetcher() = default;

  virtual auto matchDetail(std::string_view MatchId)
      -> std::expected<std::string, core::Error> = 0;
};

class MatchProvider : public MatchListFetcher, public MatchDetailFetcher {
public:
  virtual auto name() const -> std::string_view = 0;
};

class SportmonksProvider final : public MatchProvider {
public:
  SportmonksProvider(
      const core::Config &Config, std::shared_ptr<core::Transport> Transport
  );

  auto name() const -> std::string_view override { return Client.name(); }
  auto listMatches(matches::MatchType Type)
      -> std::expected<std::vector<matches::MatchSummary>, core::Error>
      override;
  auto matchDetail(std::string_view MatchId)
      -> std::expected<std::string, core::Error> override;

private:
  SportmonksClient Client;
};

class CricbuzzProvider final : public MatchProvider {
public:
  CricbuzzProvider(
      const core::Config &Config, std::shared_ptr<core::Transport> Transport
  );

  auto name() const -> std::string_view override { return Client.name(); }
  auto listMatches(matches::MatchType Type)
      -> std::expected<std::vector<matches::MatchSummary>, core::Error>
      override;
  auto matchDetail(std::string_view MatchId)
      -> std::expected<std::string, core::Error> override;

private:
  CricbuzzClient Client;
};

// Chosen once at startup from Config::ActiveProvider.
auto makeMatchProvider(
    const core::Config &Config, std::shared_ptr<core::Transport> Transport
) -> std::shared_ptr<MatchProvider>;

} // namespace cricket::providers
