#include "fantasy_core/bonus.hpp"
#include "fantasy_core/logging.hpp"

#include <cstdint>
#include <map>
#include <tuple>

namespace fantasy_core {

double BonusRow::long_td_bonus() const {
  return 2.0 * (pass_td_40p + rush_td_40p + rec_td_40p) +
         3.0 * (pass_td_50p + rush_td_50p + rec_td_50p);
}

const std::vector<std::string> &bonus_columns() {
  static const std::vector<std::string> cols = {
      "pass_td_40p", "pass_td_50p", "rush_td_40p", "rush_td_50p",
      "rec_td_40p",  "rec_td_50p",  "long_td_bonus"};
  return cols;
}

namespace {

using BonusKey = std::tuple<int, int, std::string>;

enum class Role { Passer, Rusher, Receiver };

void credit(std::map<BonusKey, BonusRow> &acc, const PlayEvent &e,
            const std::string &player_id, Role role, double yards) {
  BonusRow &row = acc[BonusKey{e.season, e.week, player_id}];
  row.season = e.season;
  row.week = e.week;
  row.player_id = player_id;
  const bool fifty = yards >= 50.0;
  switch (role) {
  case Role::Passer:
    (fifty ? row.pass_td_50p : row.pass_td_40p) += 1;
    break;
  case Role::Rusher:
    (fifty ? row.rush_td_50p : row.rush_td_40p) += 1;
    break;
  case Role::Receiver:
    (fifty ? row.rec_td_50p : row.rec_td_40p) += 1;
    break;
  }
}

} // namespace

std::vector<BonusRow> derive_bonuses(const std::vector<PlayEvent> &events) {
  std::map<BonusKey, BonusRow> acc;
  std::size_t skipped = 0;
  for (const auto &e : events) {
    const bool pass_td = e.pass && e.pass_touchdown;
    const bool rush_td = e.rush_attempt && e.rush_touchdown;
    if (!pass_td && !rush_td)
      continue;
    if (!e.yards_gained) {
      ++skipped;
      continue;
    }
    const double yards = *e.yards_gained;
    if (yards < 40.0)
      continue;

    if (pass_td) {
      if (!e.passer_id && !e.receiver_id)
        ++skipped;
      if (e.passer_id)
        credit(acc, e, *e.passer_id, Role::Passer, yards);
      if (e.receiver_id)
        credit(acc, e, *e.receiver_id, Role::Receiver, yards);
    } else if (e.rusher_id) {
      credit(acc, e, *e.rusher_id, Role::Rusher, yards);
    } else {
      ++skipped;
    }
  }
  if (skipped > 0) {
    logger()->debug("Skipped {} touchdown plays without yardage or player",
                    skipped);
  }

  std::vector<BonusRow> out;
  out.reserve(acc.size());
  for (auto &kv : acc)
    out.push_back(std::move(kv.second));
  return out;
}

Table bonuses_to_table(const std::vector<BonusRow> &rows) {
  const std::size_t n = rows.size();
  std::vector<std::int64_t> season(n), week(n);
  std::vector<std::string> player_id(n);
  std::vector<std::int64_t> p40(n), p50(n), r40(n), r50(n), c40(n), c50(n);
  std::vector<double> bonus(n);
  for (std::size_t i = 0; i < n; ++i) {
    const BonusRow &b = rows[i];
    season[i] = b.season;
    week[i] = b.week;
    player_id[i] = b.player_id;
    p40[i] = b.pass_td_40p;
    p50[i] = b.pass_td_50p;
    r40[i] = b.rush_td_40p;
    r50[i] = b.rush_td_50p;
    c40[i] = b.rec_td_40p;
    c50[i] = b.rec_td_50p;
    bonus[i] = b.long_td_bonus();
  }
  Table t;
  t.add_column(Column::int64_column("season", std::move(season)));
  t.add_column(Column::int64_column("week", std::move(week)));
  t.add_column(Column::string_column("player_id", std::move(player_id)));
  t.add_column(Column::int64_column("pass_td_40p", std::move(p40)));
  t.add_column(Column::int64_column("pass_td_50p", std::move(p50)));
  t.add_column(Column::int64_column("rush_td_40p", std::move(r40)));
  t.add_column(Column::int64_column("rush_td_50p", std::move(r50)));
  t.add_column(Column::int64_column("rec_td_40p", std::move(c40)));
  t.add_column(Column::int64_column("rec_td_50p", std::move(c50)));
  t.add_column(Column::float64_column("long_td_bonus", std::move(bonus)));
  return t;
}

} // namespace fantasy_core
