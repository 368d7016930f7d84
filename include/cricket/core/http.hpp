#pragma once

#include "glaze/core/opts.hpp"
#include <cstdint>

namespace cricket::core {

// Absent canonical fields are part of the contract and serialize as null.
inline constexpr auto ResponseOpts = glz::opts{.skip_null_members = false};

// Error statuses travel in core::Error; these are the ones written directly.
enum class HttpStatus : uint16_t {
  Ok = 200,
  InternalServerError = 500,
};

inline constexpr bool isSuccess(int Status) {
  return Status >= 200 && Status < 300;
}

} // namespace cricket::core
