#pragma once
#include "cricket/core/http.hpp"
#include "cricket/core/result.hpp"

#include "glaze/json/write.hpp"
#include "glaze/net/http_server.hpp"
#include "spdlog/spdlog.h"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace cricket::server::middleware {

struct ErrorBody {
  std::string detail;
};

inline void writeBody(glz::response &Response, int Status, std::string Body) {
  Response.status(Status)
      .header("Content-Type", "application/json")
      .body(std::move(Body));
}

template <class T>
void writeJson(
    glz::response &Response, const T &Value,
    core::HttpStatus Status = core::HttpStatus::Ok
) {
  std::string Buffer;
  if (auto WriteError = glz::write<core::ResponseOpts>(Value, Buffer)) {
    spdlog::error("Failed to serialize response: {}", glz::format_error(WriteError));
    writeBody(
        Response, static_cast<int>(core::HttpStatus::InternalServerError),
        R"({"detail":"Failed to serialize response"})"
    );
    return;
  }
  writeBody(Response, static_cast<int>(Status), std::move(Buffer));
}

inline void writeError(glz::response &Response, const core::Error &Error) {
  std::string Buffer;
  if (glz::write_json(ErrorBody{Error.Message}, Buffer)) {
    Buffer = R"({"detail":"Internal Server Error"})";
  }
  writeBody(Response, Error.Status, std::move(Buffer));
}

// Runs a handler body; anything it throws becomes a truncated 500.
template <class Fn>
void guarded(glz::response &Response, std::string_view Route, Fn &&Handler) {
  try {
    std::forward<Fn>(Handler)();
  } catch (const std::exception &Err) {
    spdlog::error("{} - Unhandled exception: {}", Route, Err.what());
    writeError(Response, core::Error::internal(Err.what()));
  }
}

} // namespace cricket::server::middleware
