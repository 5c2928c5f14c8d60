#pragma once

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "fantasy_core/table.hpp"

namespace fantasy_core {

// True for per-game rate columns (percentages, shares, EPA, CPOE, ...).
// These are averaged across weeks instead of summed.
bool is_rate_column(const std::string &name);

// One row per distinct `group_key` value, in order of first appearance:
//  - group_key;
//  - other string columns taken from the identity's latest (season, week);
//  - games, the number of rows;
//  - count columns summed (int64 stays int64) and rate columns averaged
//    over the non-missing weeks. season and week are not aggregated.
Table aggregate(const Table &rows, const std::string &group_key);

struct PointSummary {
  int games{0};
  double mean{0.0};
  double median{0.0};
  double max{0.0};
  double min{0.0};
  double stddev{0.0}; // sample (n - 1); 0 below two games
  double mad{0.0};    // median absolute deviation from the median
  int nuclear{0};     // >= 20
  int boom{0};        // >= 15
  int bust{0};        // < 10
};

PointSummary summarize_points(const Eigen::VectorXd &points);

// Season-to-date, recent-form (latest `recent_games` rows by season and
// week) and, when `weeks` is non-empty, selected-week summaries for each
// name. Names are looked up among players first, then D/ST teams; names
// found in neither are skipped. Columns: name, type ("Player" or "D/ST"),
// then season_*, recent_* and weeks_* groups of num_games, mean_points,
// median_points, max_points, min_points, stddev_points, mad_points,
// nuclear_games, boom_games, bust_games.
Table summary_table(const Table &players, const Table &dst,
                    const std::vector<std::string> &names,
                    const std::vector<int> &weeks, int recent_games = 4);

} // namespace fantasy_core
