#pragma once
#include "cricket/core/result.hpp"
#include "cricket/providers/clients.hpp"
#include "cricket/rankings/models.hpp"

#include <expected>
#include <string_view>

namespace cricket::rankings {

// One request for teams and one per player category. A failed request leaves
// its slot as []; only an unknown format is an error.
auto fetchRankings(providers::IccRankingsClient &Client, std::string_view FormatParam)
    -> std::expected<RankingsResult, core::Error>;

} // namespace cricket::rankings
