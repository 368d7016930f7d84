#include "cricket/news/service.hpp"

#include "cricket/core/logging.hpp"
#include "cricket/news/feed.hpp"
#include "cricket/providers/clients.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace cricket::news {

static auto Log() { return core::logger(core::UpstreamLogger); }

NewsList fetchNews(core::Transport &Transport, const std::vector<std::string> &Feeds) {
  NewsList Result;

  for (const auto &Url : Feeds) {
    if (Result.Items.size() >= MaxItems) {
      break;
    }

    auto Body = providers::requestText(Transport, Url);
    if (!Body) {
      Log()->warn(
          "Skipping feed {}: {}", Url,
          core::truncateMessage(Body.error().Message)
      );
      continue;
    }

    auto Parsed = parseFeed(*Body);
    if (!Parsed) {
      Log()->warn("Skipping feed {}: {}", Url, Parsed.error().Message);
      continue;
    }

    auto Source = Parsed->Title.value_or("RSS");
    auto Count = std::min(Parsed->Entries.size(), EntriesPerFeed);
    Log()->debug("Feed {} '{}' gave {} entries", Url, Source, Count);
    for (std::size_t I = 0; I < Count; ++I) {
      Result.Items.push_back(toNewsItem(Parsed->Entries[I], Source));
    }
  }

  if (Result.Items.size() > MaxItems) {
    Result.Items.resize(MaxItems);
  }
  return Result;
}

} // namespace cricket::news
