#pragma once

#include <string>
#include <vector>

#include "fantasy_core/play_event.hpp"
#include "fantasy_core/table.hpp"

namespace fantasy_core {

struct BonusRow {
  int season{0};
  int week{0};
  std::string player_id;
  int pass_td_40p{0};
  int pass_td_50p{0};
  int rush_td_40p{0};
  int rush_td_50p{0};
  int rec_td_40p{0};
  int rec_td_50p{0};

  double long_td_bonus() const;
};

// Bonus-carrying column names, in output order.
const std::vector<std::string> &bonus_columns();

// Long-TD counts per (season, week, player_id), sorted by that key. A TD
// of 50+ yards counts only as 50p, [40, 50) only as 40p. Passers are
// credited on passing TDs, rushers on rushing TDs and receivers on
// receiving TDs. Plays without a yardage value or a player id for the role
// are skipped.
std::vector<BonusRow> derive_bonuses(const std::vector<PlayEvent> &events);

// season, week, player_id, the six counts (int64), long_td_bonus (float64).
Table bonuses_to_table(const std::vector<BonusRow> &rows);

} // namespace fantasy_core
