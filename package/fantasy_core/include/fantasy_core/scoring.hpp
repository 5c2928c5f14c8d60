#pragma once

#include <Eigen/Dense>

#include "fantasy_core/stat_row.hpp"
#include "fantasy_core/table.hpp"

namespace fantasy_core {

// League rubric. Every function here is pure and an all-zero row scores 0
// for every class. A D/ST line with every field zero is a unit with no game
// recorded, not a shutout, so it gets no bucket awards.

// 2 per TD of 40-49 yards, 3 per TD of 50+ yards, across pass/rush/rec.
double long_td_bonus(const OffenseStats &s);
double offense_points(const OffenseStats &s);
double kicker_points(const KickerStats &s);

// Points-allowed bucket: 0 -> 8, 1-6 -> 4, 7-13 -> 3, 14-17 -> 1,
// 18-27 -> 0, 28-34 -> -1, 35-45 -> -3, 46+ -> -5.
int points_allowed_component(int points_allowed);
// Yards-allowed bucket: <100 -> 8, <200 -> 5, <300 -> 3, <350 -> 1,
// <450 -> 0, <500 -> -1, <550 -> -2, else -3.
int yards_allowed_component(int yards_allowed);
double dst_points(const DstStats &s);

// Dispatches on the row's variant. Offensive rows must carry a QB/RB/WR/TE
// position; anything else throws UnsupportedPositionError.
double score(const StatRow &row);

// fantasy_points for every row of a position table, in row order.
Eigen::VectorXd score_rows(const Table &table, PositionClass pc);
// Copy of `table` with a float64 fantasy_points column appended (or
// replaced).
Table score_table(const Table &table, PositionClass pc);

// Player table holding several offensive and kicker positions. Each row is
// scored by its own position column; an unsupported position throws.
Table score_player_table(const Table &table);

} // namespace fantasy_core
