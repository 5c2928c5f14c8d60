#include <catch2/catch.hpp>

#include "fantasy_core/errors.hpp"
#include "fantasy_core/stat_row.hpp"

using namespace fantasy_core;

TEST_CASE("Provider positions map to position classes", "[stat_row]") {
  REQUIRE(position_class_from_string("QB") == PositionClass::QB);
  REQUIRE(position_class_from_string("rb") == PositionClass::RB);
  REQUIRE(position_class_from_string("WR") == PositionClass::WR_TE);
  REQUIRE(position_class_from_string("te") == PositionClass::WR_TE);
  REQUIRE(position_class_from_string("K") == PositionClass::K);
  REQUIRE(position_class_from_string("D/ST") == PositionClass::DST);
  REQUIRE(position_class_from_string("DEF") == PositionClass::DST);

  REQUIRE_FALSE(is_supported_position("FB"));
  REQUIRE_FALSE(is_supported_position(""));
  try {
    position_class_from_string("OL");
    FAIL("expected UnsupportedPositionError");
  } catch (const UnsupportedPositionError &e) {
    REQUIRE(e.position() == "OL");
  }

  REQUIRE(std::string(position_class_key(PositionClass::WR_TE)) == "wr_te");
  REQUIRE(std::string(position_class_label(PositionClass::DST)) == "D/ST");
}

TEST_CASE("Column registry declares types", "[stat_row]") {
  REQUIRE(stat_columns(PositionClass::DST).size() == 14);
  REQUIRE(stat_columns(PositionClass::K).size() == 14);
  REQUIRE(stat_columns(PositionClass::QB).size() ==
          stat_columns(PositionClass::WR_TE).size());

  REQUIRE(canonical_column_type("sacks") == ColumnType::Float64);
  REQUIRE(canonical_column_type("points_allowed") == ColumnType::Int64);
  REQUIRE(canonical_column_type("team") == ColumnType::String);
  REQUIRE(canonical_column_type("opponent_team") == ColumnType::String);
  REQUIRE(canonical_column_type("air_yards_share") == ColumnType::Float64);
}

TEST_CASE("rows_to_table and row_from_table agree", "[stat_row]") {
  StatRow qb;
  qb.key = {2025, 3, "KC", "00-0033873", "P.Mahomes", "QB"};
  OffenseStats s;
  s.passing_yards = 301;
  s.passing_tds = 2;
  s.pass_td_50p = 1;
  qb.stats = s;

  StatRow wr;
  wr.key = {2025, 3, "KC", "00-0036000", "X.Worthy", "WR"};

  const Table t = rows_to_table({qb, wr}, PositionClass::QB);
  REQUIRE(t.row_count() == 2);
  REQUIRE(t.column_count() == player_key_columns().size() +
                                  stat_columns(PositionClass::QB).size());
  REQUIRE(t.column("passing_yards").type == ColumnType::Int64);
  REQUIRE(t.column("passing_yards").int_at(0) == 301);

  const StatRow back = row_from_table(t, 0, PositionClass::QB);
  REQUIRE(back.key.player_id == "00-0033873");
  REQUIRE(back.key.week == 3);
  REQUIRE(back.position_class() == PositionClass::QB);
  const auto &bs = std::get<OffenseStats>(back.stats);
  REQUIRE(bs.passing_tds == Approx(2.0));
  REQUIRE(bs.pass_td_50p == Approx(1.0));

  // Absent columns read as zero under another class.
  const StatRow as_kicker = row_from_table(t, 1, PositionClass::K);
  REQUIRE(std::get<KickerStats>(as_kicker.stats).pat_made == Approx(0.0));
}

TEST_CASE("D/ST rows use the team as identity", "[stat_row]") {
  StatRow row;
  row.key = {2025, 1, "BUF", "BUF", "BUF", "DST"};
  DstStats d;
  d.sacks = 2.5;
  d.points_allowed = 17;
  row.stats = d;

  const Table t = rows_to_table({row}, PositionClass::DST);
  REQUIRE(t.column_names().front() == "season");
  REQUIRE(t.has_column("team"));
  REQUIRE_FALSE(t.has_column("player_id"));
  REQUIRE(t.column("sacks").number_at(0) == Approx(2.5));

  const StatRow back = row_from_table(t, 0, PositionClass::DST);
  REQUIRE(back.key.player_id == "BUF");
  REQUIRE(back.position_class() == PositionClass::DST);
  REQUIRE(std::get<DstStats>(back.stats).points_allowed == Approx(17.0));
}
