#pragma once
#include "cricket/core/json.hpp"

#include <glaze/glaze.hpp>
#include <glaze/json/generic.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cricket::rankings {

enum class Format : uint8_t { Test, Odi, T20 };

inline std::string_view toString(Format Value) {
  switch (Value) {
  case Format::Test:
    return "test";
  case Format::Odi:
    return "odi";
  case Format::T20:
    return "t20";
  }
  return "odi";
}

inline std::optional<Format> parseFormat(std::string_view Name) {
  if (Name == "test") {
    return Format::Test;
  }
  if (Name == "odi") {
    return Format::Odi;
  }
  if (Name == "t20") {
    return Format::T20;
  }
  return std::nullopt;
}

inline constexpr std::array<std::string_view, 3> PlayerCategories{
    "batting", "bowling", "allrounder"
};

// Rows are passed through in the rankings site's own shape.
struct PlayerRankings {
  glz::generic Batting = core::json::emptyArray();
  glz::generic Bowling = core::json::emptyArray();
  glz::generic Allrounder = core::json::emptyArray();
};

struct RankingsResult {
  std::string Format;
  glz::generic Teams = core::json::emptyArray();
  PlayerRankings Players;
};

} // namespace cricket::rankings

template <> struct glz::meta<cricket::rankings::PlayerRankings> {
  using T = cricket::rankings::PlayerRankings;
  static constexpr auto value = glz::object(
      "batting", &T::Batting, "bowling", &T::Bowling, "allrounder",
      &T::Allrounder
  );
};

template <> struct glz::meta<cricket::rankings::RankingsResult> {
  using T = cricket::rankings::RankingsResult;
  static constexpr auto value = glz::object(
      "format", &T::Format, "teams", &T::Teams, "players", &T::Players
  );
};
