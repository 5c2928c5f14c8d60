#include <catch2/catch.hpp>

#include <stdexcept>

#include "fantasy_core/dst.hpp"
#include "fantasy_core/scoring.hpp"

using namespace fantasy_core;

namespace {

// BUF hosts KC in week 1 of 2025.
PlayEvent play(const std::string &posteam, const std::string &defteam) {
  PlayEvent e;
  e.season = 2025;
  e.week = 1;
  e.game_id = "2025_01_KC_BUF";
  e.home_team = "BUF";
  e.away_team = "KC";
  e.posteam = posteam;
  e.defteam = defteam;
  return e;
}

std::vector<PlayEvent> sample_game() {
  std::vector<PlayEvent> plays;

  PlayEvent completion = play("KC", "BUF");
  completion.play_type = "pass";
  completion.pass = true;
  completion.yards_gained = 20;
  completion.total_home_score = 0;
  completion.total_away_score = 0;
  plays.push_back(completion);

  PlayEvent sack = play("KC", "BUF");
  sack.play_type = "pass";
  sack.pass = true;
  sack.sack = true;
  sack.yards_gained = -7;
  plays.push_back(sack);

  PlayEvent pick = play("KC", "BUF");
  pick.play_type = "pass";
  pick.pass = true;
  pick.interception = true;
  pick.yards_gained = 0;
  plays.push_back(pick);

  PlayEvent run = play("BUF", "KC");
  run.play_type = "run";
  run.rush_attempt = true;
  run.yards_gained = 12;
  run.total_home_score = 7;
  run.total_away_score = 0;
  plays.push_back(run);

  PlayEvent fumble = play("KC", "BUF");
  fumble.play_type = "run";
  fumble.rush_attempt = true;
  fumble.fumble = true;
  fumble.fumble_lost = true;
  fumble.fumble_recovery_1_team = "BUF";
  fumble.yards_gained = 3;
  plays.push_back(fumble);

  PlayEvent field_goal = play("KC", "BUF");
  field_goal.play_type = "field_goal";
  field_goal.field_goal_result = "made";
  field_goal.total_home_score = 10;
  field_goal.total_away_score = 3;
  plays.push_back(field_goal);

  PlayEvent kick_return = play("KC", "BUF");
  kick_return.play_type = "kickoff";
  kick_return.kickoff_attempt = true;
  kick_return.return_touchdown = true;
  kick_return.touchdown = true;
  kick_return.return_team = "KC";
  kick_return.td_team = "KC";
  kick_return.yards_gained = 100;
  plays.push_back(kick_return);

  return plays;
}

const DstStats &stats_of(const std::vector<StatRow> &rows,
                         const std::string &team) {
  for (const auto &r : rows) {
    if (r.key.team == team)
      return std::get<DstStats>(r.stats);
  }
  FAIL("no D/ST row for " << team);
  throw std::logic_error("unreachable");
}

} // namespace

TEST_CASE("D/ST rows are keyed and ordered by season, week, team", "[dst]") {
  const auto rows = derive_dst_rows(sample_game());
  REQUIRE(rows.size() == 2);
  REQUIRE(rows[0].key.team == "BUF");
  REQUIRE(rows[1].key.team == "KC");
  REQUIRE(rows[0].key.player_id == "BUF");
  REQUIRE(rows[0].key.position == "DST");
  REQUIRE(rows[0].position_class() == PositionClass::DST);
}

TEST_CASE("Defensive credit goes to the defending team", "[dst]") {
  const auto rows = derive_dst_rows(sample_game());

  const DstStats &buf = stats_of(rows, "BUF");
  REQUIRE(buf.sacks == Approx(1.0));
  REQUIRE(buf.interceptions == Approx(1.0));
  REQUIRE(buf.fumbles_recovered == Approx(1.0));
  REQUIRE(buf.kr_td == Approx(0.0));
  REQUIRE(buf.yards_allowed == Approx(20.0 - 7.0 + 0.0 + 3.0));
  REQUIRE(buf.points_allowed == Approx(3.0));
  REQUIRE(dst_points(buf) == Approx(6.0 + 4.0 + 8.0));

  const DstStats &kc = stats_of(rows, "KC");
  REQUIRE(kc.sacks == Approx(0.0));
  REQUIRE(kc.kr_td == Approx(1.0));
  REQUIRE(kc.yards_allowed == Approx(12.0));
  REQUIRE(kc.points_allowed == Approx(10.0));
  REQUIRE(dst_points(kc) == Approx(6.0 + 3.0 + 8.0));
}

TEST_CASE("Edge cases in D/ST credit", "[dst]") {
  SECTION("an interception by the offense is not counted") {
    PlayEvent odd = play("BUF", "BUF");
    odd.interception = true;
    const auto rows = derive_dst_rows({odd});
    REQUIRE(stats_of(rows, "BUF").interceptions == Approx(0.0));
  }
  SECTION("a fumble recovered by the offense is not counted") {
    PlayEvent e = play("KC", "BUF");
    e.fumble = true;
    e.fumble_recovery_1_team = "KC";
    const auto rows = derive_dst_rows({e});
    REQUIRE(stats_of(rows, "BUF").fumbles_recovered == Approx(0.0));
  }
  SECTION("an interception return TD needs td_team to match") {
    PlayEvent e = play("KC", "BUF");
    e.pass = true;
    e.interception = true;
    e.return_touchdown = true;
    e.td_team = "BUF";
    e.yards_gained = 0;
    const auto rows = derive_dst_rows({e});
    REQUIRE(stats_of(rows, "BUF").int_td == Approx(1.0));
  }
  SECTION("a blocked field goal credits the defense") {
    PlayEvent e = play("KC", "BUF");
    e.play_type = "field_goal";
    e.field_goal_result = "blocked";
    const auto rows = derive_dst_rows({e});
    REQUIRE(stats_of(rows, "BUF").blocked_kicks == Approx(1.0));
    REQUIRE(stats_of(rows, "BUF").blk_kick_td == Approx(0.0));
  }
  SECTION("plays without a defense are ignored") {
    PlayEvent e = play("", "");
    e.sack = true;
    e.game_id.clear();
    REQUIRE(derive_dst_rows({e}).empty());
  }
}

TEST_CASE("D/ST table layout", "[dst]") {
  const Table t = derive_dst_table(sample_game());
  REQUIRE(t.row_count() == 2);
  REQUIRE(t.column_count() == dst_key_columns().size() +
                                  stat_columns(PositionClass::DST).size());
  REQUIRE(t.column("team").string_at(0) == "BUF");
  REQUIRE(t.column("sacks").type == ColumnType::Float64);
  REQUIRE(t.column("points_allowed").type == ColumnType::Int64);
  REQUIRE(t.column("points_allowed").int_at(1) == 10);
  REQUIRE_FALSE(t.has_column("fantasy_points"));

  const Table scored = score_table(t, PositionClass::DST);
  REQUIRE(scored.column("fantasy_points").number_at(0) == Approx(18.0));
  REQUIRE(scored.column("fantasy_points").number_at(1) == Approx(17.0));
}
