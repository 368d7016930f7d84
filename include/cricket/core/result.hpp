#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace cricket::core {

enum class ErrorKind : uint8_t {
  ProviderNotConfigured,
  UpstreamError,
  UpstreamUnreachable,
  BadRequest,
  Internal,
};

inline constexpr std::size_t MaxErrorMessage = 200;

// Cut a message to at most Limit bytes without splitting a UTF-8 sequence.
inline std::string truncateMessage(
    std::string_view Message, std::size_t Limit = MaxErrorMessage
) {
  if (Message.size() <= Limit) {
    return std::string(Message);
  }
  auto Cut = Limit;
  while (Cut > 0 &&
         (static_cast<unsigned char>(Message[Cut]) & 0xC0) == 0x80) {
    --Cut;
  }
  return std::string(Message.substr(0, Cut));
}

struct Error {
  std::string Message;
  ErrorKind Kind{ErrorKind::Internal};
  int Status{500};

  static Error notConfigured(std::string Message) {
    return {std::move(Message), ErrorKind::ProviderNotConfigured, 501};
  }

  // Upstream body is forwarded verbatim.
  static Error upstream(int Status, std::string Body) {
    return {std::move(Body), ErrorKind::UpstreamError, Status};
  }

  static Error unreachable(std::string_view Message) {
    return {truncateMessage(Message), ErrorKind::UpstreamUnreachable, 500};
  }

  static Error badRequest(std::string Message) {
    return {std::move(Message), ErrorKind::BadRequest, 400};
  }

  static Error internal(std::string_view Message) {
    return {truncateMessage(Message), ErrorKind::Internal, 500};
  }
};

} // namespace cricket::core
