#pragma once
#include "cricket/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cricket::core {

enum class Provider : uint8_t { Sportmonks, Cricbuzz };

inline std::string_view toString(Provider Value) {
  switch (Value) {
  case Provider::Sportmonks:
    return "sportmonks";
  case Provider::Cricbuzz:
    return "rapidapi";
  }
  return "unknown";
}

inline std::optional<Provider> parseProvider(std::string_view Name) {
  std::string Lower(Name);
  std::ranges::transform(Lower, Lower.begin(), [](unsigned char Ch) {
    return std::tolower(Ch);
  });
  if (Lower == "sportmonks" || Lower == "primary_stats") {
    return Provider::Sportmonks;
  }
  if (Lower == "rapidapi" || Lower == "cricbuzz" || Lower == "alt_stats") {
    return Provider::Cricbuzz;
  }
  return std::nullopt;
}

struct Config {
  Provider ActiveProvider{Provider::Sportmonks};
  std::optional<std::string> CricketApiKey;
  std::string SportmonksBase{"https://cricket.sportmonks.com/api/v2.0"};
  std::optional<std::string> RapidApiHost;
  std::optional<std::string> RapidApiKey;
  std::string RapidApiBase{"https://cricbuzz-cricket.p.rapidapi.com"};
  std::string RankingsBase{"https://www.icc-cricket.com/iccrankings/api"};
  std::optional<std::string> XBearerToken;
  std::string XApiBase{"https://api.twitter.com/2"};
  std::vector<std::string> NewsFeeds{
      "https://www.espncricinfo.com/rss/content/story/feeds/0.xml",
      "https://www.icc-cricket.com/rss/news",
  };
  std::string Host{"0.0.0.0"};
  int Port = 8000;
  std::string LogLevel{"info"};
  std::optional<std::string> LogDir;

  // True when either stats provider has a key, regardless of which is active.
  bool hasProviderCredential() const {
    return CricketApiKey.has_value() || RapidApiKey.has_value();
  }

  static std::expected<Config, Error> load() {
    // Empty variables count as unset.
    auto Env = [](const char *Name) -> std::optional<std::string> {
      auto *Value = std::getenv(Name);
      if (Value == nullptr || *Value == '\0') {
        return std::nullopt;
      }
      return std::string(Value);
    };

    Config Cfg;

    if (auto ProviderEnv = Env("CRICKET_API_PROVIDER")) {
      auto Parsed = parseProvider(*ProviderEnv);
      if (!Parsed) {
        return std::unexpected(Error{
            std::format("Unknown CRICKET_API_PROVIDER '{}'", *ProviderEnv)
        });
      }
      Cfg.ActiveProvider = *Parsed;
    }

    Cfg.CricketApiKey = Env("CRICKET_API_KEY");
    Cfg.RapidApiHost = Env("RAPIDAPI_HOST");
    Cfg.RapidApiKey = Env("RAPIDAPI_KEY");
    Cfg.XBearerToken = Env("X_BEARER_TOKEN");
    Cfg.LogDir = Env("LOG_DIR");

    if (auto Base = Env("SPORTMONKS_BASE")) {
      Cfg.SportmonksBase = *Base;
    }
    if (auto Base = Env("RAPIDAPI_BASE")) {
      Cfg.RapidApiBase = *Base;
    }
    if (auto Base = Env("ICC_RANKINGS_BASE")) {
      Cfg.RankingsBase = *Base;
    }
    if (auto Base = Env("X_API_BASE")) {
      Cfg.XApiBase = *Base;
    }
    if (auto Host = Env("HOST")) {
      Cfg.Host = *Host;
    }
    if (auto Level = Env("LOG_LEVEL")) {
      Cfg.LogLevel = *Level;
    }

    if (auto Feeds = Env("NEWS_FEEDS")) {
      Cfg.NewsFeeds.clear();
      std::string_view Rest{*Feeds};
      while (!Rest.empty()) {
        auto Comma = Rest.find(',');
        auto Item = Rest.substr(0, Comma);
        while (!Item.empty() && std::isspace(static_cast<unsigned char>(Item.front()))) {
          Item.remove_prefix(1);
        }
        while (!Item.empty() && std::isspace(static_cast<unsigned char>(Item.back()))) {
          Item.remove_suffix(1);
        }
        if (!Item.empty()) {
          Cfg.NewsFeeds.emplace_back(Item);
        }
        if (Comma == std::string_view::npos) {
          break;
        }
        Rest.remove_prefix(Comma + 1);
      }
    }

    if (auto PortEnv = Env("PORT")) {
      int Port = 0;
      auto [Ptr, Ec] = std::from_chars(
          PortEnv->data(), PortEnv->data() + PortEnv->size(), Port
      );
      if (Ec != std::errc{} || Ptr != PortEnv->data() + PortEnv->size() ||
          Port <= 0 || Port > 65535) {
        return std::unexpected(
            Error{std::format("Invalid PORT '{}'", *PortEnv)}
        );
      }
      Cfg.Port = Port;
    }

    return Cfg;
  }
};

} // namespace cricket::core
