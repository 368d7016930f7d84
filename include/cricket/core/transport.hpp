#pragma once
#include "cricket/core/result.hpp"
#include "glaze/net/http_client.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>

namespace cricket::core {

using Headers = std::unordered_map<std::string, std::string>;

// Every outbound call gets the same fixed budget; there are no retries.
inline constexpr std::chrono::milliseconds UpstreamTimeout =
    std::chrono::seconds(15);

struct HttpResult {
  int Status{0};
  std::string Body;
};

// Outbound HTTP GET. Any status code is a result; only failing to get one
// (DNS, connect, TLS, timeout) is an UpstreamUnreachable error.
class Transport {
public:
  virtual ~Transport() = default;

  virtual auto get(
      const std::string &Url,
      const Headers &RequestHeaders,
      std::chrono::milliseconds Timeout
  ) -> std::expected<HttpResult, Error> = 0;
};

class GlazeTransport final : public Transport {
public:
  static auto create() -> std::expected<std::shared_ptr<GlazeTransport>, Error>;

  explicit GlazeTransport(std::shared_ptr<glz::http_client> Client);

  auto get(
      const std::string &Url,
      const Headers &RequestHeaders,
      std::chrono::milliseconds Timeout
  ) -> std::expected<HttpResult, Error> override;

private:
  std::shared_ptr<glz::http_client> Client;
};

} // namespace cricket::core
