#pragma once
#include "cricket/core/result.hpp"
#include "cricket/news/models.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace cricket::news {

// Reads RSS 2.0, RSS 1.0 (RDF) and Atom documents. This is a tag scanner, not
// a validating XML parser: it only fails when the document has no feed root.
auto parseFeed(std::string_view Xml) -> std::expected<Feed, core::Error>;

// Resolves the five predefined entities and numeric character references.
std::string decodeEntities(std::string_view Text);

NewsItem toNewsItem(const FeedEntry &Entry, std::string_view Source);

} // namespace cricket::news
