#include "fantasy_core/scoring.hpp"
#include "fantasy_core/errors.hpp"
#include "fantasy_core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>
#include <vector>

namespace fantasy_core {

double long_td_bonus(const OffenseStats &s) {
  return 2.0 * (s.pass_td_40p + s.rush_td_40p + s.rec_td_40p) +
         3.0 * (s.pass_td_50p + s.rush_td_50p + s.rec_td_50p);
}

double offense_points(const OffenseStats &s) {
  double pts = 0.0;

  // Passing
  pts += 0.04 * s.passing_yards;
  pts += 6.0 * s.passing_tds;
  pts += -3.0 * s.passing_interceptions;
  pts += 2.0 * s.passing_2pt_conversions;

  // Rushing
  pts += 0.10 * s.rushing_yards;
  pts += 6.0 * s.rushing_tds;
  pts += 2.0 * s.rushing_2pt_conversions;

  // Receiving (full PPR)
  pts += 0.10 * s.receiving_yards;
  pts += 1.0 * s.receptions;
  pts += 6.0 * s.receiving_tds;
  pts += 2.0 * s.receiving_2pt_conversions;

  // Return, defensive and fumble-recovery TDs credited to the player
  pts += 6.0 * (s.special_teams_tds + s.def_tds + s.fumble_recovery_tds);
  pts += 1.0 * s.def_safeties;

  pts += -2.0 * (s.rushing_fumbles_lost + s.receiving_fumbles_lost +
                 s.sack_fumbles_lost);

  pts += long_td_bonus(s);
  return pts;
}

double kicker_points(const KickerStats &s) {
  double pts = 0.0;

  pts += 1.0 * s.pat_made;

  pts += 3.0 * (s.fg_made_0_19 + s.fg_made_20_29 + s.fg_made_30_39);
  pts += 4.0 * s.fg_made_40_49;
  pts += 5.0 * s.fg_made_50_59;
  pts += 6.0 * s.fg_made_60_;

  const double miss_0_39 =
      s.fg_missed_0_19 + s.fg_missed_20_29 + s.fg_missed_30_39;
  const double bucket_total =
      miss_0_39 + s.fg_missed_40_49 + s.fg_missed_50_59 + s.fg_missed_60_;
  const double total_missed = std::max(s.fg_missed, bucket_total);

  // -1 for every miss, -4 net inside 40 yards, -3 net for 40-49.
  pts += -1.0 * total_missed;
  pts += -3.0 * miss_0_39;
  pts += -2.0 * s.fg_missed_40_49;
  return pts;
}

int points_allowed_component(int points_allowed) {
  const int pa = points_allowed;
  if (pa <= 0)
    return 8;
  if (pa <= 6)
    return 4;
  if (pa <= 13)
    return 3;
  if (pa <= 17)
    return 1;
  if (pa <= 27)
    return 0;
  if (pa <= 34)
    return -1;
  if (pa <= 45)
    return -3;
  return -5;
}

int yards_allowed_component(int yards_allowed) {
  const int ya = yards_allowed;
  if (ya < 100)
    return 8;
  if (ya < 200)
    return 5;
  if (ya < 300)
    return 3;
  if (ya < 350)
    return 1;
  if (ya < 450)
    return 0;
  if (ya < 500)
    return -1;
  if (ya < 550)
    return -2;
  return -3;
}

namespace {

bool no_game_recorded(const DstStats &s) {
  return s.sacks == 0.0 && s.interceptions == 0.0 &&
         s.fumbles_recovered == 0.0 && s.blocked_kicks == 0.0 &&
         s.safeties == 0.0 && s.int_td == 0.0 && s.fum_ret_td == 0.0 &&
         s.kr_td == 0.0 && s.pr_td == 0.0 && s.blk_kick_td == 0.0 &&
         s.two_pt_returns == 0.0 && s.one_pt_safeties == 0.0 &&
         s.points_allowed == 0.0 && s.yards_allowed == 0.0;
}

} // namespace

double dst_points(const DstStats &s) {
  if (no_game_recorded(s))
    return 0.0;

  double pts = 0.0;

  pts += 2.0 * (s.sacks + s.interceptions + s.fumbles_recovered +
                s.blocked_kicks);
  pts += 5.0 * s.safeties;

  pts += 6.0 * (s.int_td + s.fum_ret_td + s.kr_td + s.pr_td + s.blk_kick_td);
  pts += 2.0 * s.two_pt_returns;
  pts += 1.0 * s.one_pt_safeties;

  pts += points_allowed_component(
      static_cast<int>(std::lround(s.points_allowed)));
  pts += yards_allowed_component(
      static_cast<int>(std::lround(s.yards_allowed)));
  return pts;
}

double score(const StatRow &row) {
  if (const auto *k = std::get_if<KickerStats>(&row.stats))
    return kicker_points(*k);
  if (const auto *d = std::get_if<DstStats>(&row.stats))
    return dst_points(*d);
  const PositionClass pc = position_class_from_string(row.key.position);
  if (pc == PositionClass::K || pc == PositionClass::DST)
    throw UnsupportedPositionError(row.key.position);
  return offense_points(std::get<OffenseStats>(row.stats));
}

Eigen::VectorXd score_rows(const Table &table, PositionClass pc) {
  const auto n = static_cast<Eigen::Index>(table.row_count());
  Eigen::VectorXd points(n);
  const bool check_position =
      pc != PositionClass::DST && table.has_column("position");
  for (Eigen::Index i = 0; i < n; ++i) {
    const auto row_idx = static_cast<std::size_t>(i);
    StatRow row = row_from_table(table, row_idx, pc);
    if (check_position && position_class_from_string(row.key.position) != pc) {
      throw UnsupportedPositionError(
          row.key.position + " row in " + position_class_label(pc) + " table");
    }
    if (pc != PositionClass::K && pc != PositionClass::DST &&
        !table.has_column("position")) {
      // Offensive tables without a position column score as the table class.
      row.key.position = pc == PositionClass::WR_TE ? "WR"
                                                    : position_class_label(pc);
    }
    points[i] = score(row);
  }
  logger()->debug("Scored {} {} rows (total {:.2f})", n,
                  position_class_label(pc), points.sum());
  return points;
}

Table score_table(const Table &table, PositionClass pc) {
  const Eigen::VectorXd points = score_rows(table, pc);
  std::vector<double> values(points.data(), points.data() + points.size());
  return table.with_column(
      Column::float64_column("fantasy_points", std::move(values)));
}

Table score_player_table(const Table &table) {
  const Column &position = table.column("position");
  std::vector<double> values(table.row_count(), 0.0);
  for (std::size_t i = 0; i < table.row_count(); ++i) {
    const PositionClass pc = position_class_from_string(position.text_at(i));
    if (pc == PositionClass::DST)
      throw UnsupportedPositionError(position.text_at(i));
    values[i] = score(row_from_table(table, i, pc));
  }
  logger()->debug("Scored {} player rows (total {:.2f})", values.size(),
                  std::accumulate(values.begin(), values.end(), 0.0));
  return table.with_column(
      Column::float64_column("fantasy_points", std::move(values)));
}

} // namespace fantasy_core
