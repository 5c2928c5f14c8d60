#include <catch2/catch.hpp>

#include "fantasy_core/errors.hpp"
#include "fantasy_core/report.hpp"

using namespace fantasy_core;

namespace {

StatRow player(int season, int week, const std::string &id,
               const std::string &position, double yards) {
  StatRow row;
  row.key = {season, week, "KC", id, id + " Name", position};
  OffenseStats s;
  if (position == "QB")
    s.passing_yards = yards;
  else
    s.receiving_yards = yards;
  row.stats = s;
  return row;
}

// Provider-style player table, deliberately out of order.
Table weekly_players() {
  return rows_to_table(
      {
          player(2025, 2, "P3", "WR", 50),
          player(2025, 1, "P2", "QB", 250),
          player(2024, 1, "P1", "QB", 300),
          player(2025, 1, "P1", "TE", 40),
          player(2025, 2, "P9", "FB", 10),
          player(2025, 1, "P5", "K", 0),
          player(2025, 2, "P4", "RB", 90),
      },
      PositionClass::QB);
}

Table weekly_dst() {
  StatRow a;
  a.key = {2025, 2, "BUF", "BUF", "BUF", "DST"};
  DstStats s;
  s.sacks = 2;
  s.yards_allowed = 320;
  s.points_allowed = 20;
  a.stats = s;
  StatRow b = a;
  b.key.week = 1;
  b.key.team = "NYJ";
  return rows_to_table({a, b}, PositionClass::DST);
}

ReportConfig config_for(const std::string &weeks) {
  ReportConfig c;
  c.seasons = {2025};
  c.week_spec = weeks;
  return c;
}

} // namespace

TEST_CASE("Week specs", "[report]") {
  REQUIRE(parse_week_spec("8,9,11-13") == std::vector<int>{8, 9, 11, 12, 13});
  REQUIRE(parse_week_spec("8-10") == std::vector<int>{8, 9, 10});
  REQUIRE(parse_week_spec("11") == std::vector<int>{11});
  REQUIRE(parse_week_spec(" 3 , 1,3 ") == std::vector<int>{1, 3});
  REQUIRE(parse_week_spec("").empty());
  REQUIRE(parse_week_spec("  ").empty());

  for (const char *bad : {"8-x", "abc", "10-8", "0", "-3", "1.5"})
    REQUIRE_THROWS_AS(parse_week_spec(bad), FilterSpecError);

  SECTION("weeks past the postseason are rejected") {
    REQUIRE(parse_week_spec("20-22") == std::vector<int>{20, 21, 22});
    for (const char *bad : {"23", "2147483647", "1-3000000", "1-2147483647",
                            "99999999999"})
      REQUIRE_THROWS_AS(parse_week_spec(bad), FilterSpecError);
    try {
      parse_week_spec("1,5-3000000");
      FAIL("expected FilterSpecError");
    } catch (const FilterSpecError &e) {
      REQUIRE(e.token() == "5-3000000");
    }
  }

  try {
    parse_week_spec("8,nine");
    FAIL("expected FilterSpecError");
  } catch (const FilterSpecError &e) {
    REQUIRE(e.token() == "nine");
  }
}

TEST_CASE("Season and name lists", "[report]") {
  REQUIRE(parse_seasons("2024, 2025,2024") == std::vector<int>{2024, 2025});
  REQUIRE_THROWS_AS(parse_seasons("20x5"), FilterSpecError);
  REQUIRE(parse_name_list(" Mahomes , ,Kelce") ==
          std::vector<std::string>{"Mahomes", "Kelce"});
  REQUIRE(parse_name_list("").empty());
}

TEST_CASE("Output file names", "[report]") {
  REQUIRE(week_suffix({11}) == "_week_11");
  REQUIRE(week_suffix({8, 9, 10}) == "_week_8-10");
  REQUIRE(week_suffix({8, 9, 11}) == "_week_8,9,11");
  REQUIRE(week_suffix({}).empty());

  REQUIRE(safe_name("Ja'Marr Chase") == "Ja_Marr_Chase");
  REQUIRE(stats_file_name("qb_stats", {8, 9, 10}) == "qb_stats_week_8-10.csv");
  REQUIRE(stats_file_name("dst_stats", {}) == "dst_stats.csv");

  REQUIRE(lookup_file_name({"Patrick Mahomes"}, {}, {11}) ==
          "Patrick_Mahomes_stats_week_11.csv");
  REQUIRE(lookup_file_name({}, {"BUF"}, {}) == "BUF_dst_stats.csv");
  REQUIRE(lookup_file_name({"Patrick Mahomes"}, {"BUF"}, {1, 2}) ==
          "combined_stats_week_1-2.csv");
}

TEST_CASE("A malformed week spec fails before any data is read",
          "[report]") {
  REQUIRE_THROWS_AS(ReportAssembler(config_for("8-x")), FilterSpecError);
}

TEST_CASE("The stage chain filters, scores and sorts", "[report]") {
  const ReportAssembler assembler(config_for("1-2"));
  const ReportResult r =
      assembler.assemble(weekly_players(), TableKind::Players);

  REQUIRE(r.matched());
  REQUIRE(r.stage == ReportStage::Sorted);
  // 2024 and FB rows are gone.
  REQUIRE(r.table.row_count() == 5);
  REQUIRE(r.table.has_column("fantasy_points"));

  const Column &week = r.table.column("week");
  const Column &id = r.table.column("player_id");
  REQUIRE(week.int_at(0) == 1);
  REQUIRE(id.string_at(0) == "P1");
  REQUIRE(id.string_at(1) == "P2");
  REQUIRE(id.string_at(2) == "P5");
  REQUIRE(id.string_at(3) == "P3");
  REQUIRE(id.string_at(4) == "P4");
  REQUIRE(r.table.column("fantasy_points").number_at(1) == Approx(10.0));
}

TEST_CASE("A filter that empties the table reports where it happened",
          "[report]") {
  SECTION("week") {
    const ReportResult r = ReportAssembler(config_for("17"))
                               .assemble(weekly_players(), TableKind::Players);
    REQUIRE_FALSE(r.matched());
    REQUIRE(r.status == ReportStatus::NoRowsMatched);
    REQUIRE(r.stage == ReportStage::WeekFiltered);
    REQUIRE(r.table.empty());
  }
  SECTION("season") {
    ReportConfig c = config_for("");
    c.seasons = {2019};
    const ReportResult r =
        ReportAssembler(c).assemble(weekly_players(), TableKind::Players);
    REQUIRE(r.stage == ReportStage::SeasonFiltered);
  }
  SECTION("identity") {
    const ReportResult r = ReportAssembler(config_for("")).assemble(
        weekly_dst(), TableKind::Dst, {"MIA"});
    REQUIRE(r.stage == ReportStage::IdentityFiltered);
    REQUIRE_FALSE(r.matched());
  }
  SECTION("empty input") {
    const ReportResult r = ReportAssembler(config_for(""))
                               .assemble(Table{}, TableKind::Players);
    REQUIRE(r.stage == ReportStage::Unfiltered);
    REQUIRE_FALSE(r.matched());
  }
}

TEST_CASE("Identity filter uses the display column", "[report]") {
  const Table players = weekly_players();
  REQUIRE(identity_column(players, TableKind::Players) == "player_name");
  REQUIRE(identity_column(players, TableKind::Dst) == "team");

  const ReportResult r = ReportAssembler(config_for("")).assemble(
      players, TableKind::Players, {"P1 Name"});
  REQUIRE(r.matched());
  REQUIRE(r.table.row_count() == 1);
  REQUIRE(r.table.column("position").string_at(0) == "TE");
}

TEST_CASE("Position outputs", "[report]") {
  const ReportAssembler assembler(config_for(""));
  const ReportResult r =
      assembler.assemble(weekly_players(), TableKind::Players);
  const auto parts = assembler.split_positions(r.table);

  REQUIRE(parts.size() == 4);
  REQUIRE(parts[0].position == PositionClass::QB);
  REQUIRE(parts[1].position == PositionClass::RB);
  REQUIRE(parts[2].position == PositionClass::WR_TE);
  REQUIRE(parts[3].position == PositionClass::K);
  REQUIRE(parts[2].table.row_count() == 2);

  const auto names = parts[2].table.column_names();
  REQUIRE(names[0] == "season");
  REQUIRE(names[5] == "position");
  REQUIRE(names.back() == "fantasy_points");

  const Table dst = assembler.dst_output(
      assembler.assemble(weekly_dst(), TableKind::Dst).table);
  REQUIRE(dst.column("team").string_at(0) == "NYJ");
  REQUIRE(dst.column_names().front() == "season");
  REQUIRE(dst.column_names().back() == "fantasy_points");
  REQUIRE(dst.column("fantasy_points").number_at(0) ==
          Approx(4.0 + 0.0 + 1.0));
}

TEST_CASE("Combined reports put players before D/ST", "[report]") {
  const ReportAssembler assembler(config_for(""));
  const Table players =
      assembler.assemble(weekly_players(), TableKind::Players).table;
  const Table dst = assembler.assemble(weekly_dst(), TableKind::Dst).table;

  const ReportResult r = assembler.combine(players, dst);
  REQUIRE(r.matched());
  REQUIRE(r.table.row_count() == players.row_count() + dst.row_count());

  const Column &id = r.table.column("player_id");
  const Column &week = r.table.column("week");
  bool in_dst = false;
  std::int64_t last_week = 0;
  for (std::size_t i = 0; i < r.table.row_count(); ++i) {
    const bool is_dst = id.string_at(i).empty();
    if (in_dst)
      REQUIRE(is_dst);
    if (is_dst && !in_dst) {
      in_dst = true;
      last_week = 0;
    }
    REQUIRE(week.int_at(i) >= last_week);
    last_week = week.int_at(i);
  }
  REQUIRE(in_dst);
  for (const auto &c : r.table.columns())
    REQUIRE_FALSE(c.any_missing());

  REQUIRE_FALSE(assembler.combine(Table{}, Table{}).matched());
  REQUIRE(assembler.combine(Table{}, dst).table.row_count() == 2);
}
