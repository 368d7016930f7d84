#pragma once
#include "cricket/core/transport.hpp"
#include "cricket/news/models.hpp"

#include <string>
#include <vector>

namespace cricket::news {

// Feeds are read in order, the first EntriesPerFeed entries of each are kept
// and the result is capped at MaxItems. A feed that cannot be fetched or
// parsed is skipped.
NewsList fetchNews(core::Transport &Transport, const std::vector<std::string> &Feeds);

} // namespace cricket::news
