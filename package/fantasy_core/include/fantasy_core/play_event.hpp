#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fantasy_core/table.hpp"

namespace fantasy_core {

// One play-by-play record. Provider flags arrive as 0/1 with nulls; a null
// flag reads as false. Team codes use "" for absent.
struct PlayEvent {
  int season{0};
  int week{0};
  std::string game_id;

  std::string posteam;
  std::string defteam;
  std::string home_team;
  std::string away_team;
  std::optional<double> total_home_score;
  std::optional<double> total_away_score;

  std::string play_type;
  bool pass{false};
  bool rush_attempt{false};
  bool touchdown{false};
  bool pass_touchdown{false};
  bool rush_touchdown{false};
  std::optional<double> yards_gained;

  std::optional<std::string> passer_id;
  std::optional<std::string> rusher_id;
  std::optional<std::string> receiver_id;

  bool sack{false};
  bool interception{false};
  bool safety{false};
  bool fumble{false};
  bool fumble_lost{false};
  std::string fumble_recovery_1_team;
  std::string fumble_recovery_2_team;

  bool kickoff_attempt{false};
  bool punt_attempt{false};
  bool punt_blocked{false};
  std::string field_goal_result;  // "made", "missed", "blocked"
  std::string extra_point_result; // "good", "failed", "blocked", "safety"
  bool return_touchdown{false};
  std::string return_team;
  std::string td_team;
  bool defensive_two_point_conv{false};
  bool defensive_extra_point_conv{false};
};

// Reads a play-by-play table by the provider's column names. Absent
// columns take the field defaults above.
std::vector<PlayEvent> events_from_table(const Table &pbp);

} // namespace fantasy_core
