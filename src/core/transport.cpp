#include "cricket/core/transport.hpp"

#include "cricket/core/logging.hpp"
#include "glaze/net/http_client.hpp"

#include <asio/ssl.hpp>
#include <format>
#include <future>
#include <spdlog/spdlog.h>
#include <string_view>

namespace cricket::core {

static auto Log() { return logger(UpstreamLogger); }

// Query strings can carry credentials (api_token), so they stay out of logs.
static std::string_view withoutQuery(std::string_view Url) {
  return Url.substr(0, Url.find('?'));
}

auto GlazeTransport::create()
    -> std::expected<std::shared_ptr<GlazeTransport>, Error> {
  auto Client = std::make_shared<glz::http_client>();

  auto Ok = Client->configure_system_ca_certificates();
  if (!Ok) {
    Log()->error("Error: Could not find CA certificates.");
    return std::unexpected(
        Error::internal("Error: Could not find CA certificates.")
    );
  }
  return std::make_shared<GlazeTransport>(std::move(Client));
}

GlazeTransport::GlazeTransport(std::shared_ptr<glz::http_client> Client)
    : Client(std::move(Client)) {}

auto GlazeTransport::get(
    const std::string &Url,
    const Headers &RequestHeaders,
    std::chrono::milliseconds Timeout
) -> std::expected<HttpResult, Error> {
  Log()->debug("Making HTTP GET request to: {}", withoutQuery(Url));

  auto Pending = Client->get_async(Url, RequestHeaders);
  if (Pending.wait_for(Timeout) != std::future_status::ready) {
    // The client finishes the abandoned request on its own.
    Log()->warn(
        "GET {} timed out after {}ms", withoutQuery(Url), Timeout.count()
    );
    return std::unexpected(Error::unreachable(
        std::format("Upstream request timed out after {}ms", Timeout.count())
    ));
  }

  auto Response = Pending.get();
  if (!Response) {
    Log()->warn(
        "GET {} failed: {}", withoutQuery(Url), Response.error().message()
    );
    return std::unexpected(Error::unreachable(
        std::format("Upstream request failed: {}", Response.error().message())
    ));
  }

  Log()->debug("GET {} -> {}", withoutQuery(Url), Response->status_code);
  return HttpResult{
      .Status = static_cast<int>(Response->status_code),
      .Body = std::move(Response->response_body),
  };
}

} // namespace cricket::core
