#pragma once
#include "cricket/core/config.hpp"
#include "cricket/core/transport.hpp"

#include <glaze/json/generic.hpp>
#include <glaze/json/read.hpp>

#include <chrono>
#include <expected>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cricket::testing {

// Replays canned responses keyed by URL (query string excluded) and records
// every call it receives.
class StubTransport final : public core::Transport {
public:
  struct Call {
    std::string Url;
    core::Headers RequestHeaders;
    std::chrono::milliseconds Timeout{0};
  };

  std::vector<Call> Calls;

  void respond(const std::string &Url, int Status, std::string Body) {
    Routes[Url] = core::HttpResult{.Status = Status, .Body = std::move(Body)};
  }

  void fail(const std::string &Url, std::string_view Message) {
    Routes[Url] = std::unexpected(core::Error::unreachable(Message));
  }

  auto get(
      const std::string &Url,
      const core::Headers &RequestHeaders,
      std::chrono::milliseconds Timeout
  ) -> std::expected<core::HttpResult, core::Error> override {
    Calls.push_back({Url, RequestHeaders, Timeout});
    auto It = Routes.find(Url.substr(0, Url.find('?')));
    if (It == Routes.end()) {
      return std::unexpected(core::Error::unreachable("no route for " + Url));
    }
    return It->second;
  }

private:
  std::map<std::string, std::expected<core::HttpResult, core::Error>> Routes;
};

inline glz::generic parseJson(const std::string &Text) {
  glz::generic Value;
  if (auto Error = glz::read_json(Value, Text)) {
    throw std::runtime_error("bad test fixture: " + Text);
  }
  return Value;
}

// Config with every credential unset and predictable base URLs.
inline core::Config testConfig() {
  core::Config Cfg;
  Cfg.SportmonksBase = "https://sm.test/api/v2.0";
  Cfg.RapidApiBase = "https://cb.test";
  Cfg.RankingsBase = "https://icc.test/api";
  Cfg.XApiBase = "https://x.test/2";
  Cfg.NewsFeeds.clear();
  return Cfg;
}

} // namespace cricket::testing
