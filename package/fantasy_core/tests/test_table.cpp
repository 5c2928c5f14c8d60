#include <catch2/catch.hpp>

#include "fantasy_core/errors.hpp"
#include "fantasy_core/table.hpp"

using namespace fantasy_core;

namespace {

Table sample() {
  Table t;
  t.add_column(Column::int64_column("week", {3, 1, 2, 1}));
  t.add_column(Column::string_column("name", {"c", "b", "a", "a"}));
  t.add_column(Column::float64_column("points", {1.5, 2.0, 3.0, 4.0}));
  return t;
}

} // namespace

TEST_CASE("Table tracks rows and columns", "[table]") {
  const Table t = sample();
  REQUIRE(t.row_count() == 4);
  REQUIRE(t.column_count() == 3);
  REQUIRE(t.column_names() == std::vector<std::string>{"week", "name",
                                                       "points"});
  REQUIRE(t.has_column("name"));
  REQUIRE_FALSE(t.has_column("team"));
  REQUIRE_THROWS_AS(t.column("team"), SchemaError);
  REQUIRE(t.schema_string() == "{week: int64, name: string, points: float64}");
}

TEST_CASE("add_column rejects a row count mismatch", "[table]") {
  Table t = sample();
  REQUIRE_THROWS_AS(t.add_column(Column::int64_column("x", {1, 2})),
                    SchemaError);
}

TEST_CASE("sort_by is stable and puts missing cells last", "[table]") {
  Table t = sample();
  Column w = t.column("week");
  w.set_missing(0);
  t.add_column(w);

  const Table sorted = t.sort_by({"week"});
  const Column &names = sorted.column("name");
  REQUIRE(names.string_at(0) == "b");
  REQUIRE(names.string_at(1) == "a");
  REQUIRE(names.string_at(2) == "a");
  REQUIRE(names.string_at(3) == "c");
  REQUIRE(sorted.column("week").is_missing(3));
  REQUIRE(sorted.column("points").number_at(1) == Approx(4.0));

  const Table by_two = sample().sort_by({"name", "week"});
  REQUIRE(by_two.column("points").number_at(0) == Approx(4.0));
  REQUIRE(by_two.column("points").number_at(1) == Approx(3.0));
}

TEST_CASE("filter, take and head keep column types", "[table]") {
  const Table t = sample();
  const Table f = t.filter({1, 0, 1, 0});
  REQUIRE(f.row_count() == 2);
  REQUIRE(f.column("name").string_at(1) == "a");
  REQUIRE(t.head(10).row_count() == 4);
  REQUIRE(t.head(1).column("week").int_at(0) == 3);
  REQUIRE_THROWS_AS(t.filter({1, 0}), SchemaError);
}

TEST_CASE("Strict concat rejects schema differences", "[table]") {
  const Table a = sample();

  SECTION("identical schemas append rows") {
    const Table both = Table::concat({a, a});
    REQUIRE(both.row_count() == 8);
    REQUIRE(both.column("name").string_at(4) == "c");
  }
  SECTION("a type mismatch throws") {
    Table b = sample();
    b.add_column(b.column("week").cast(ColumnType::Float64));
    REQUIRE_THROWS_AS(Table::concat({a, b}), SchemaError);
  }
  SECTION("a missing column throws") {
    REQUIRE_THROWS_AS(Table::concat({a, a.drop({"points"})}), SchemaError);
  }
  SECTION("a different order throws") {
    REQUIRE_THROWS_AS(
        Table::concat({a, a.select({"name", "week", "points"})}),
        SchemaError);
  }
}

TEST_CASE("left_join fills unmatched rows with missing cells", "[table]") {
  Table left;
  left.add_column(Column::string_column("id", {"x", "y", "z"}));
  Table right;
  right.add_column(Column::string_column("id", {"z", "x"}));
  right.add_column(Column::int64_column("bonus", {3, 1}));

  const Table j = left.left_join(right, {"id"});
  REQUIRE(j.row_count() == 3);
  const Column &bonus = j.column("bonus");
  REQUIRE(bonus.int_at(0) == 1);
  REQUIRE(bonus.is_missing(1));
  REQUIRE(bonus.int_at(2) == 3);

  REQUIRE_THROWS_AS(j.left_join(right, {"id"}), SchemaError);

  Table wrong_key;
  wrong_key.add_column(Column::int64_column("id", {1}));
  REQUIRE_THROWS_AS(left.left_join(wrong_key, {"id"}), SchemaError);
}

TEST_CASE("cast only widens", "[table]") {
  const Column ints = Column::int64_column("n", {1, 2});
  const Column floats = ints.cast(ColumnType::Float64);
  REQUIRE(floats.type == ColumnType::Float64);
  REQUIRE(floats.number_at(1) == Approx(2.0));
  REQUIRE(ints.cast(ColumnType::String).string_at(0) == "1");
  REQUIRE_THROWS_AS(floats.cast(ColumnType::Int64), SchemaError);

  const Column nulls = Column::null_column("n", 2);
  const Column typed = nulls.cast(ColumnType::String).fill_missing();
  REQUIRE(typed.type == ColumnType::String);
  REQUIRE_FALSE(typed.any_missing());
  REQUIRE(typed.string_at(1).empty());
}
