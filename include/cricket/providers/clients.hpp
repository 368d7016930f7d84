#pragma once
#include "cricket/core/config.hpp"
#include "cricket/core/result.hpp"
#include "cricket/core/transport.hpp"
#include "cricket/core/url.hpp"

#include <glaze/json/generic.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cricket::providers {

// GET a URL and classify the outcome: non-2xx becomes UpstreamError with the
// upstream status and body, transport failure stays UpstreamUnreachable.
auto requestText(
    core::Transport &Transport,
    const std::string &Url,
    const core::Headers &RequestHeaders = {}
) -> std::expected<std::string, core::Error>;

auto parsePayload(const std::string &Body)
    -> std::expected<glz::generic, core::Error>;

// Base for every JSON upstream. Subclasses supply the base URL, the credential
// check and the auth mechanism; fetch() does the rest.
class ProviderClient {
public:
  virtual ~ProviderClient() = default;

  // Fails with ProviderNotConfigured before any network I/O when the
  // credential is missing.
  auto fetch(std::string_view Path, core::QueryParams Params = {})
      -> std::expected<glz::generic, core::Error>;

  // Same checks as fetch(), but the body is returned byte for byte once it
  // is known to be JSON. Keeps 64-bit ids and key order intact.
  auto fetchRaw(std::string_view Path, core::QueryParams Params = {})
      -> std::expected<std::string, core::Error>;

  virtual auto name() const -> std::string_view = 0;

protected:
  explicit ProviderClient(std::shared_ptr<core::Transport> Transport);

  virtual auto baseUrl() const -> std::string_view = 0;
  // Message for the 501 when unconfigured, nullopt when ready.
  virtual auto missingCredential() const -> std::optional<std::string> {
    return std::nullopt;
  }
  virtual void authorize(core::QueryParams &, core::Headers &) const {}

private:
  auto fetchText(std::string_view Path, core::QueryParams Params)
      -> std::expected<std::string, core::Error>;

  std::shared_ptr<core::Transport> Transport;
};

// Primary stats provider. Token goes in the api_token query parameter.
class SportmonksClient final : public ProviderClient {
public:
  SportmonksClient(
      const core::Config &Config, std::shared_ptr<core::Transport> Transport
  );

  auto name() const -> std::string_view override { return "sportmonks"; }

protected:
  auto baseUrl() const -> std::string_view override { return Base; }
  auto missingCredential() const -> std::optional<std::string> override;
  void authorize(core::QueryParams &Params, core::Headers &) const override;

private:
  std::string Base;
  std::optional<std::string> ApiKey;
};

// Alternate stats provider behind RapidAPI. Key and host go in headers.
class CricbuzzClient final : public ProviderClient {
public:
  CricbuzzClient(
      const core::Config &Config, std::shared_ptr<core::Transport> Transport
  );

  auto name() const -> std::string_view override { return "rapidapi"; }

protected:
  auto baseUrl() const -> std::string_view override { return Base; }
  auto missingCredential() const -> std::optional<std::string> override;
  void authorize(core::QueryParams &, core::Headers &Headers) const override;

private:
  std::string Base;
  std::optional<std::string> ApiKey;
  std::optional<std::string> Host;
};

// Public ICC rankings endpoint, no credentials.
class IccRankingsClient final : public ProviderClient {
public:
  IccRankingsClient(
      const core::Config &Config, std::shared_ptr<core::Transport> Transport
  );

  auto name() const -> std::string_view override { return "icc"; }

protected:
  auto baseUrl() const -> std::string_view override { return Base; }

private:
  std::string Base;
};

// X (Twitter) v2 API with a bearer token.
class TwitterClient final : public ProviderClient {
public:
  TwitterClient(
      const core::Config &Config, std::shared_ptr<core::Transport> Transport
  );

  auto name() const -> std::string_view override { return "x"; }
  bool configured() const { return Token.has_value(); }

protected:
  auto baseUrl() const -> std::string_view override { return Base; }
  auto missingCredential() const -> std::optional<std::string> override;
  void authorize(core::QueryParams &, core::Headers &Headers) const override;

private:
  std::string Base;
  std::optional<std::string> Token;
};

} // namespace cricket::providers
