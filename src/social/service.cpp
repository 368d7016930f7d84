#include "cricket/social/service.hpp"

#include "cricket/core/json.hpp"

#include <cmath>
#include <spdlog/spdlog.h>
#include <string>
#include <variant>

namespace cricket::social {

namespace json = core::json;

TrendingPlayers trendingPlayers() {
  return {
      .Players =
          {
              {"Virat Kohli", "India", "imVkohli",
               "https://pbs.twimg.com/profile_images/1390384696942200832/"
               "0B8zW0gq_400x400.jpg"},
              {"Joe Root", "England", "root66",
               "https://pbs.twimg.com/profile_images/1334100239247923202/"
               "0YfYxQyW_400x400.jpg"},
              {"Babar Azam", "Pakistan", "babarazam258",
               "https://pbs.twimg.com/profile_images/1674019404247615488/"
               "1jWkQd2w_400x400.jpg"},
              {"Kane Williamson", "New Zealand", "", ""},
              {"Pat Cummins", "Australia", "patcummins30", ""},
          },
  };
}

// public_metrics values are counts; anything non-numeric is dropped.
static std::map<std::string, std::int64_t> toMetrics(const glz::generic *Value) {
  std::map<std::string, std::int64_t> Metrics;
  if (Value == nullptr) {
    return Metrics;
  }
  const auto *Obj = std::get_if<json::Object>(&Value->data);
  if (Obj == nullptr) {
    return Metrics;
  }
  for (const auto &[Key, Count] : *Obj) {
    if (const auto *Number = std::get_if<double>(&Count.data)) {
      Metrics.emplace(Key, static_cast<std::int64_t>(std::llround(*Number)));
    }
  }
  return Metrics;
}

auto searchTweets(providers::TwitterClient &Client, std::string_view Query)
    -> std::expected<TweetSearch, core::Error> {
  if (Query.empty()) {
    return std::unexpected(core::Error::badRequest("query is required"));
  }
  if (!Client.configured()) {
    spdlog::debug("Tweet search skipped: no bearer token");
    return TweetSearch{.Tweets = {}, .Note = "X_BEARER_TOKEN not configured"};
  }

  auto Payload = Client.fetch(
      "tweets/search/recent",
      {
          {"query", std::string(Query)},
          {"tweet.fields", "created_at,public_metrics"},
          {"max_results", std::to_string(MaxTweetResults)},
      }
  );
  if (!Payload) {
    return std::unexpected(Payload.error());
  }

  TweetSearch Result;
  if (const auto *Data = json::asArray(json::member(*Payload, "data"))) {
    Result.Tweets.reserve(Data->size());
    for (const auto &Item : *Data) {
      Result.Tweets.push_back({
          .Id = json::asString(json::member(Item, "id")),
          .Text = json::asString(json::member(Item, "text")),
          .CreatedAt = json::asString(json::member(Item, "created_at")),
          .Metrics = toMetrics(json::member(Item, "public_metrics")),
      });
    }
  }
  spdlog::debug("Tweet search returned {} tweets", Result.Tweets.size());
  return Result;
}

} // namespace cricket::social
