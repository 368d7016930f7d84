#pragma once
#include "cricket/core/result.hpp"
#include "cricket/providers/clients.hpp"
#include "cricket/social/models.hpp"

#include <expected>
#include <string_view>

namespace cricket::social {

inline constexpr int MaxTweetResults = 10;

// Curated list; no upstream is consulted.
TrendingPlayers trendingPlayers();

// An unconfigured client is not an error: the result is empty with a Note.
auto searchTweets(providers::TwitterClient &Client, std::string_view Query)
    -> std::expected<TweetSearch, core::Error>;

} // namespace cricket::social
