#include <catch2/catch.hpp>

#include "fantasy_core/errors.hpp"
#include "fantasy_core/scoring.hpp"

using namespace fantasy_core;

namespace {

StatRow offense_row(const std::string &position, const OffenseStats &s) {
  StatRow row;
  row.key = {2025, 1, "KC", "id", "name", position};
  row.stats = s;
  return row;
}

} // namespace

TEST_CASE("All-zero rows score zero for every class", "[scoring]") {
  REQUIRE(offense_points(OffenseStats{}) == Approx(0.0));
  REQUIRE(kicker_points(KickerStats{}) == Approx(0.0));
  REQUIRE(dst_points(DstStats{}) == Approx(0.0));

  for (const char *pos : {"QB", "RB", "WR", "TE"})
    REQUIRE(score(offense_row(pos, OffenseStats{})) == Approx(0.0));

  StatRow k;
  k.key.position = "K";
  k.stats = KickerStats{};
  REQUIRE(score(k) == Approx(0.0));

  StatRow d;
  d.key.position = "DST";
  d.stats = DstStats{};
  REQUIRE(score(d) == Approx(0.0));
}

TEST_CASE("Offensive scoring", "[scoring]") {
  SECTION("passing line") {
    OffenseStats s;
    s.passing_yards = 300;
    s.passing_tds = 2;
    s.passing_interceptions = 1;
    REQUIRE(offense_points(s) == Approx(21.0));
  }
  SECTION("full PPR receiving line") {
    OffenseStats s;
    s.receptions = 8;
    s.receiving_yards = 100;
    s.receiving_tds = 1;
    s.receiving_fumbles_lost = 1;
    REQUIRE(offense_points(s) == Approx(22.0));
  }
  SECTION("long TD bonus tiers are exclusive") {
    OffenseStats s;
    s.rec_td_50p = 1;
    REQUIRE(long_td_bonus(s) == Approx(3.0));
    s.rec_td_50p = 0;
    s.rush_td_40p = 1;
    REQUIRE(long_td_bonus(s) == Approx(2.0));
    s.pass_td_50p = 2;
    REQUIRE(long_td_bonus(s) == Approx(8.0));
  }
}

TEST_CASE("Kicker scoring", "[scoring]") {
  KickerStats s;

  SECTION("made field goal from 40-49") {
    s.fg_made_40_49 = 1;
    REQUIRE(kicker_points(s) == Approx(4.0));
  }
  SECTION("missed field goal inside 40") {
    s.fg_missed_30_39 = 1;
    REQUIRE(kicker_points(s) == Approx(-4.0));
  }
  SECTION("provider total matching the buckets is not double counted") {
    s.fg_missed_30_39 = 1;
    s.fg_missed = 1;
    REQUIRE(kicker_points(s) == Approx(-4.0));
  }
  SECTION("misses of unknown distance take the flat penalty") {
    s.fg_missed = 2;
    REQUIRE(kicker_points(s) == Approx(-2.0));
  }
  SECTION("mixed game") {
    s.pat_made = 3;
    s.fg_made_20_29 = 1;
    s.fg_made_50_59 = 1;
    s.fg_missed_40_49 = 1;
    REQUIRE(kicker_points(s) == Approx(3.0 + 3.0 + 5.0 - 3.0));
  }
}

TEST_CASE("D/ST bucket boundaries", "[scoring]") {
  REQUIRE(points_allowed_component(0) == 8);
  REQUIRE(points_allowed_component(1) == 4);
  REQUIRE(points_allowed_component(6) == 4);
  REQUIRE(points_allowed_component(7) == 3);
  REQUIRE(points_allowed_component(13) == 3);
  REQUIRE(points_allowed_component(14) == 1);
  REQUIRE(points_allowed_component(17) == 1);
  REQUIRE(points_allowed_component(18) == 0);
  REQUIRE(points_allowed_component(27) == 0);
  REQUIRE(points_allowed_component(28) == -1);
  REQUIRE(points_allowed_component(34) == -1);
  REQUIRE(points_allowed_component(35) == -3);
  REQUIRE(points_allowed_component(45) == -3);
  REQUIRE(points_allowed_component(46) == -5);

  REQUIRE(yards_allowed_component(99) == 8);
  REQUIRE(yards_allowed_component(100) == 5);
  REQUIRE(yards_allowed_component(299) == 3);
  REQUIRE(yards_allowed_component(349) == 1);
  REQUIRE(yards_allowed_component(449) == 0);
  REQUIRE(yards_allowed_component(499) == -1);
  REQUIRE(yards_allowed_component(549) == -2);
  REQUIRE(yards_allowed_component(550) == -3);
}

TEST_CASE("D/ST scoring", "[scoring]") {
  DstStats s;
  s.sacks = 3;
  s.interceptions = 1;
  s.points_allowed = 10;
  s.yards_allowed = 250;
  REQUIRE(dst_points(s) == Approx(8.0 + 3.0 + 3.0));

  DstStats shutout;
  shutout.yards_allowed = 250;
  REQUIRE(dst_points(shutout) == Approx(8.0 + 3.0));

  DstStats returns;
  returns.kr_td = 1;
  returns.safeties = 1;
  returns.points_allowed = 50;
  returns.yards_allowed = 600;
  REQUIRE(dst_points(returns) == Approx(6.0 + 5.0 - 5.0 - 3.0));
}

TEST_CASE("Unsupported positions are rejected", "[scoring]") {
  REQUIRE_THROWS_AS(score(offense_row("FB", OffenseStats{})),
                    UnsupportedPositionError);
  REQUIRE_THROWS_AS(score(offense_row("K", OffenseStats{})),
                    UnsupportedPositionError);
}

TEST_CASE("Scoring whole tables", "[scoring]") {
  OffenseStats qb;
  qb.passing_yards = 250;
  OffenseStats rb;
  rb.rushing_yards = 80;
  rb.receptions = 2;

  const Table t = rows_to_table(
      {offense_row("QB", qb), offense_row("QB", OffenseStats{})},
      PositionClass::QB);
  const Table scored = score_table(t, PositionClass::QB);
  REQUIRE(scored.column("fantasy_points").type == ColumnType::Float64);
  REQUIRE(scored.column("fantasy_points").number_at(0) == Approx(10.0));
  REQUIRE(scored.column("fantasy_points").number_at(1) == Approx(0.0));

  const Eigen::VectorXd points = score_rows(t, PositionClass::QB);
  REQUIRE(points.size() == 2);
  REQUIRE(points.sum() == Approx(10.0));
  REQUIRE(points[0] == Approx(scored.column("fantasy_points").number_at(0)));

  const Table mixed =
      rows_to_table({offense_row("QB", qb), offense_row("RB", rb)},
                    PositionClass::QB);
  REQUIRE_THROWS_AS(score_rows(mixed, PositionClass::QB),
                    UnsupportedPositionError);

  const Table by_row = score_player_table(mixed);
  REQUIRE(by_row.column("fantasy_points").number_at(0) == Approx(10.0));
  REQUIRE(by_row.column("fantasy_points").number_at(1) == Approx(10.0));
}
