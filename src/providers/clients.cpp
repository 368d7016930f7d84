#include "cricket/providers/clients.hpp"

#include "cricket/core/http.hpp"
#include "cricket/core/logging.hpp"

#include <format>
#include <glaze/json/read.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace cricket::providers {

static auto Log() { return core::logger(core::UpstreamLogger); }

auto requestText(
    core::Transport &Transport,
    const std::string &Url,
    const core::Headers &RequestHeaders
) -> std::expected<std::string, core::Error> {
  auto Response = Transport.get(Url, RequestHeaders, core::UpstreamTimeout);
  if (!Response) {
    return std::unexpected(Response.error());
  }
  if (!core::isSuccess(Response->Status)) {
    Log()->warn(
        "Upstream {} answered {}", Url.substr(0, Url.find('?')),
        Response->Status
    );
    return std::unexpected(
        core::Error::upstream(Response->Status, std::move(Response->Body))
    );
  }
  return std::move(Response->Body);
}

auto parsePayload(const std::string &Body)
    -> std::expected<glz::generic, core::Error> {
  glz::generic Payload;
  if (auto ParseError = glz::read_json(Payload, Body)) {
    auto Message = std::format(
        "Invalid JSON from upstream: {}", glz::format_error(ParseError, Body)
    );
    Log()->error("{}", Message);
    return std::unexpected(core::Error::internal(Message));
  }
  return Payload;
}

ProviderClient::ProviderClient(std::shared_ptr<core::Transport> Transport)
    : Transport(std::move(Transport)) {}

auto ProviderClient::fetchText(std::string_view Path, core::QueryParams Params)
    -> std::expected<std::string, core::Error> {
  if (auto Missing = missingCredential()) {
    Log()->warn("{} is not configured: {}", name(), *Missing);
    return std::unexpected(core::Error::notConfigured(*Missing));
  }

  core::Headers RequestHeaders;
  authorize(Params, RequestHeaders);
  auto Url = core::buildUrl(baseUrl(), Path, Params);
  return requestText(*Transport, Url, RequestHeaders);
}

auto ProviderClient::fetch(std::string_view Path, core::QueryParams Params)
    -> std::expected<glz::generic, core::Error> {
  auto Body = fetchText(Path, std::move(Params));
  if (!Body) {
    return std::unexpected(Body.error());
  }
  return parsePayload(*Body);
}

auto ProviderClient::fetchRaw(std::string_view Path, core::QueryParams Params)
    -> std::expected<std::string, core::Error> {
  auto Body = fetchText(Path, std::move(Params));
  if (!Body) {
    return std::unexpected(Body.error());
  }
  if (auto Parsed = parsePayload(*Body); !Parsed) {
    return std::unexpected(Parsed.error());
  }
  return Body;
}

SportmonksClient::SportmonksClient(
    const core::Config &Config, std::shared_ptr<core::Transport> Transport
)
    : ProviderClient(std::move(Transport)), Base(Config.SportmonksBase),
      ApiKey(Config.CricketApiKey) {}

auto SportmonksClient::missingCredential() const
    -> std::optional<std::string> {
  if (!ApiKey) {
    return "CRICKET_API_KEY not set for SportMonks";
  }
  return std::nullopt;
}

void SportmonksClient::authorize(
    core::QueryParams &Params, core::Headers &
) const {
  Params.emplace_back("api_token", *ApiKey);
}

CricbuzzClient::CricbuzzClient(
    const core::Config &Config, std::shared_ptr<core::Transport> Transport
)
    : ProviderClient(std::move(Transport)), Base(Config.RapidApiBase),
      ApiKey(Config.RapidApiKey), Host(Config.RapidApiHost) {}

auto CricbuzzClient::missingCredential() const -> std::optional<std::string> {
  if (!ApiKey || !Host) {
    return "RAPIDAPI_KEY or RAPIDAPI_HOST not configured";
  }
  return std::nullopt;
}

void CricbuzzClient::authorize(
    core::QueryParams &, core::Headers &Headers
) const {
  Headers["X-RapidAPI-Key"] = *ApiKey;
  Headers["X-RapidAPI-Host"] = *Host;
}

IccRankingsClient::IccRankingsClient(
    const core::Config &Config, std::shared_ptr<core::Transport> Transport
)
    : ProviderClient(std::move(Transport)), Base(Config.RankingsBase) {}

TwitterClient::TwitterClient(
    const core::Config &Config, std::shared_ptr<core::Transport> Transport
)
    : ProviderClient(std::move(Transport)), Base(Config.XApiBase),
      Token(Config.XBearerToken) {}

auto TwitterClient::missingCredential() const -> std::optional<std::string> {
  if (!Token) {
    return "X_BEARER_TOKEN not configured";
  }
  return std::nullopt;
}

void TwitterClient::authorize(
    core::QueryParams &, core::Headers &Headers
) const {
  Headers["Authorization"] = std::format("Bearer {}", *Token);
}

} // namespace cricket::providers
