#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "fantasy_core/table.hpp"

namespace fantasy_core {

enum class PositionClass { QB, RB, WR_TE, K, DST };

// Upper-cases and maps a provider position string. WR and TE share a class;
// "D/ST", "DST" and "DEF" map to DST. Throws UnsupportedPositionError for
// anything else (FB, OL, empty, ...).
PositionClass position_class_from_string(const std::string &position);
bool is_supported_position(const std::string &position);
// Output table key: "qb", "rb", "wr_te", "k", "dst".
const char *position_class_key(PositionClass pc);
const char *position_class_label(PositionClass pc);

struct RowKey {
  int season{0};
  int week{0};
  std::string team;
  std::string player_id; // team code for D/ST rows
  std::string player_name;
  std::string position;
};

struct OffenseStats {
  double passing_yards{0.0};
  double passing_tds{0.0};
  double passing_interceptions{0.0};
  double passing_2pt_conversions{0.0};
  double rushing_yards{0.0};
  double rushing_tds{0.0};
  double rushing_2pt_conversions{0.0};
  double receiving_yards{0.0};
  double receptions{0.0};
  double receiving_tds{0.0};
  double receiving_2pt_conversions{0.0};
  double special_teams_tds{0.0};
  double def_tds{0.0};
  double fumble_recovery_tds{0.0};
  double def_safeties{0.0};
  double rushing_fumbles_lost{0.0};
  double receiving_fumbles_lost{0.0};
  double sack_fumbles_lost{0.0};
  // Long-TD counts; [40, 50) yards and 50+ yards, never both for one play.
  double pass_td_40p{0.0};
  double pass_td_50p{0.0};
  double rush_td_40p{0.0};
  double rush_td_50p{0.0};
  double rec_td_40p{0.0};
  double rec_td_50p{0.0};
};

struct KickerStats {
  double pat_made{0.0};
  double fg_made_0_19{0.0};
  double fg_made_20_29{0.0};
  double fg_made_30_39{0.0};
  double fg_made_40_49{0.0};
  double fg_made_50_59{0.0};
  double fg_made_60_{0.0};
  double fg_missed_0_19{0.0};
  double fg_missed_20_29{0.0};
  double fg_missed_30_39{0.0};
  double fg_missed_40_49{0.0};
  double fg_missed_50_59{0.0};
  double fg_missed_60_{0.0};
  // Provider total. Misses of unknown distance only show up here, so the
  // flat penalty uses the larger of this and the bucket sum.
  double fg_missed{0.0};
};

struct DstStats {
  double sacks{0.0};
  double interceptions{0.0};
  double fumbles_recovered{0.0};
  double blocked_kicks{0.0};
  double safeties{0.0};
  double int_td{0.0};
  double fum_ret_td{0.0};
  double kr_td{0.0};
  double pr_td{0.0};
  double blk_kick_td{0.0};
  double two_pt_returns{0.0};
  double one_pt_safeties{0.0};
  double points_allowed{0.0};
  double yards_allowed{0.0};
};

using StatFields = std::variant<OffenseStats, KickerStats, DstStats>;

struct StatRow {
  RowKey key;
  StatFields stats{OffenseStats{}};

  PositionClass position_class() const;
};

struct ColumnSpec {
  std::string name;
  ColumnType type;
};

// Identity columns in output order for player and D/ST tables.
const std::vector<ColumnSpec> &player_key_columns();
const std::vector<ColumnSpec> &dst_key_columns();
// Stat columns the scoring formula for a class reads.
const std::vector<ColumnSpec> &stat_columns(PositionClass pc);
// Declared type for a known column name; Float64 for unknown names.
ColumnType canonical_column_type(const std::string &name);

// Reads row `i` of a table into the variant for `pc`. Absent columns and
// missing cells read as zero.
StatRow row_from_table(const Table &table, std::size_t i, PositionClass pc);
// Builds a table with key columns then the class's stat columns.
Table rows_to_table(const std::vector<StatRow> &rows, PositionClass pc);

} // namespace fantasy_core
