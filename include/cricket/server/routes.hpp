#pragma once
#include "cricket/core/result.hpp"
#include "cricket/server/dependencies.hpp"

#include <glaze/net/http_router.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace cricket::server {

struct RootResponse {
  std::string message;
  std::string provider;
};

struct HelloResponse {
  std::string message;
};

struct StatusResponse {
  std::string backend;
  std::string external_api;
  std::string provider;
  std::int64_t time{0};
};

RootResponse rootStatus(const core::Config &Config);
StatusResponse probeStatus(const core::Config &Config);

// "/", "/test" and "/routes", mounted at the root.
auto registerCoreRoutes(
    glz::http_router &Router,
    std::shared_ptr<dependencies::Dependencies> Deps
) -> std::expected<void, core::Error>;

// Everything under /api.
auto registerApiRoutes(
    glz::http_router &Router,
    std::shared_ptr<dependencies::Dependencies> Deps
) -> std::expected<void, core::Error>;

} // namespace cricket::server
