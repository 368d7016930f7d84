#pragma once
#include <glaze/glaze.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cricket::news {

inline constexpr std::size_t EntriesPerFeed = 20;
inline constexpr std::size_t MaxItems = 50;

// One <item> or <entry> as it appeared in the feed.
struct FeedEntry {
  std::optional<std::string> Title;
  std::optional<std::string> Link;
  std::optional<std::string> Summary;
  std::optional<std::string> Published;
  std::optional<std::string> Updated;
  std::vector<std::string> Thumbnails;
  std::vector<std::string> MediaContent;
};

struct Feed {
  std::optional<std::string> Title;
  std::vector<FeedEntry> Entries;
};

struct NewsItem {
  std::optional<std::string> Title;
  std::optional<std::string> Link;
  std::string Summary;
  std::optional<std::string> Published;
  std::string Source;
  std::optional<std::string> Image;
};

struct NewsList {
  std::vector<NewsItem> Items;
};

} // namespace cricket::news

template <> struct glz::meta<cricket::news::NewsItem> {
  using T = cricket::news::NewsItem;
  static constexpr auto value = glz::object(
      "title", &T::Title,
      "link", &T::Link,
      "summary", &T::Summary,
      "published", &T::Published,
      "source", &T::Source,
      "image", &T::Image
  );
};

template <> struct glz::meta<cricket::news::NewsList> {
  using T = cricket::news::NewsList;
  static constexpr auto value = glz::object("items", &T::Items);
};
