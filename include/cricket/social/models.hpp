#pragma once
#include <glaze/glaze.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cricket::social {

struct TrendingPlayer {
  std::string Name;
  std::string Country;
  std::string Handle;
  std::string Image;
};

struct TrendingPlayers {
  std::vector<TrendingPlayer> Players;
};

struct Tweet {
  std::optional<std::string> Id;
  std::optional<std::string> Text;
  std::optional<std::string> CreatedAt;
  std::map<std::string, std::int64_t> Metrics;
};

struct TweetSearch {
  std::vector<Tweet> Tweets;
  // Set only when the search could not run because no token is configured.
  std::optional<std::string> Note;
};

// Envelope for a search that ran; it has no note member at all.
struct TweetList {
  std::vector<Tweet> Tweets;
};

} // namespace cricket::social

template <> struct glz::meta<cricket::social::TrendingPlayer> {
  using T = cricket::social::TrendingPlayer;
  static constexpr auto value = glz::object(
      "name", &T::Name, "country", &T::Country, "handle", &T::Handle, "image",
      &T::Image
  );
};

template <> struct glz::meta<cricket::social::TrendingPlayers> {
  using T = cricket::social::TrendingPlayers;
  static constexpr auto value = glz::object("players", &T::Players);
};

template <> struct glz::meta<cricket::social::Tweet> {
  using T = cricket::social::Tweet;
  static constexpr auto value = glz::object(
      "id", &T::Id, "text", &T::Text, "created_at", &T::CreatedAt, "metrics",
      &T::Metrics
  );
};

template <> struct glz::meta<cricket::social::TweetSearch> {
  using T = cricket::social::TweetSearch;
  static constexpr auto value =
      glz::object("tweets", &T::Tweets, "note", &T::Note);
};

template <> struct glz::meta<cricket::social::TweetList> {
  using T = cricket::social::TweetList;
  static constexpr auto value = glz::object("tweets", &T::Tweets);
};
