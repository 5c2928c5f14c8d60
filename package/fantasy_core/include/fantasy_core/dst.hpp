#pragma once

#include <vector>

#include "fantasy_core/play_event.hpp"
#include "fantasy_core/stat_row.hpp"
#include "fantasy_core/table.hpp"

namespace fantasy_core {

// One DST StatRow per (season, week, team) seen in the events, sorted by
// that key. Units credited with nothing but present in a game still get a
// row carrying points and yards allowed.
//
// Credit rules:
//  - sacks, safeties, blocked kicks (punt, FG or XP), blocked-kick return
//    TDs, defensive two-point returns and one-point safeties go to defteam;
//  - interceptions need defteam != posteam; INT and fumble return TDs need
//    td_team == defteam (fumble return TDs also need fumble_lost);
//  - fumbles recovered need a recovery team equal to defteam;
//  - kickoff and punt return TDs go to return_team;
//  - points allowed is the opponent's final score (max running score per
//    game); yards allowed sums yards_gained on run/pass/scramble/kneel plays.
std::vector<StatRow> derive_dst_rows(const std::vector<PlayEvent> &events);

// derive_dst_rows laid out as a DST position table (no fantasy_points).
Table derive_dst_table(const std::vector<PlayEvent> &events);

} // namespace fantasy_core
