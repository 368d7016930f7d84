#pragma once
#include <glaze/glaze.hpp>
#include <glaze/json/generic.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cricket::matches {

enum class MatchType : uint8_t { Live, Upcoming, Completed };

inline std::string_view toString(MatchType Type) {
  switch (Type) {
  case MatchType::Live:
    return "live";
  case MatchType::Upcoming:
    return "upcoming";
  case MatchType::Completed:
    return "completed";
  }
  return "live";
}

inline std::optional<MatchType> parseMatchType(std::string_view Name) {
  if (Name == "live") {
    return MatchType::Live;
  }
  if (Name == "upcoming") {
    return MatchType::Upcoming;
  }
  if (Name == "completed") {
    return MatchType::Completed;
  }
  return std::nullopt;
}

struct TeamRef {
  glz::generic Id;
  std::optional<std::string> Name;
  std::optional<std::string> Code;
};

struct VenueRef {
  std::optional<std::string> Name;
  std::optional<std::string> City;
};

// Ids, runs, league and start time are passed through in whatever JSON type
// the provider uses.
struct MatchSummary {
  glz::generic Id;
  std::string Status;
  std::optional<std::string> Note;
  glz::generic Runs;
  glz::generic LeagueId;
  TeamRef LocalTeam;
  TeamRef VisitorTeam;
  VenueRef Venue;
  glz::generic StartingAt;
};

struct MatchList {
  std::string Type;
  std::vector<MatchSummary> Matches;
};

} // namespace cricket::matches

template <> struct glz::meta<cricket::matches::TeamRef> {
  using T = cricket::matches::TeamRef;
  static constexpr auto value =
      glz::object("id", &T::Id, "name", &T::Name, "code", &T::Code);
};

template <> struct glz::meta<cricket::matches::VenueRef> {
  using T = cricket::matches::VenueRef;
  static constexpr auto value = glz::object("name", &T::Name, "city", &T::City);
};

template <> struct glz::meta<cricket::matches::MatchSummary> {
  using T = cricket::matches::MatchSummary;
  static constexpr auto value = glz::object(
      "id", &T::Id,
      "status", &T::Status,
      "note", &T::Note,
      "runs", &T::Runs,
      "league_id", &T::LeagueId,
      "localteam", &T::LocalTeam,
      "visitorteam", &T::VisitorTeam,
      "venue", &T::Venue,
      "starting_at", &T::StartingAt
  );
};

template <> struct glz::meta<cricket::matches::MatchList> {
  using T = cricket::matches::MatchList;
  static constexpr auto value =
      glz::object("type", &T::Type, "matches", &T::Matches);
};
