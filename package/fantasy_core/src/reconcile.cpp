#include "fantasy_core/reconcile.hpp"
#include "fantasy_core/bonus.hpp"
#include "fantasy_core/logging.hpp"
#include "fantasy_core/stat_row.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace fantasy_core {

namespace {

const std::vector<std::string> &join_keys() {
  static const std::vector<std::string> keys = {"season", "week",
                                                "player_id"};
  return keys;
}

int type_rank(ColumnType t) {
  switch (t) {
  case ColumnType::Null:
    return 0;
  case ColumnType::Int64:
    return 1;
  case ColumnType::Float64:
    return 2;
  case ColumnType::String:
    return 3;
  }
  return 0;
}

ColumnType widen(ColumnType a, ColumnType b) {
  return type_rank(a) >= type_rank(b) ? a : b;
}

bool carries_data(const Column &c) {
  return c.type != ColumnType::Null && !c.all_missing();
}

// Column `name` of `table` rewritten to `type` with no missing cells.
Column conform(const Table &table, const std::string &name, ColumnType type) {
  const int idx = table.find_column(name);
  if (idx < 0)
    return Column::filled(name, type, table.row_count());
  const Column &c = table.columns()[static_cast<std::size_t>(idx)];
  if (!carries_data(c))
    return Column::filled(name, type, table.row_count());
  return c.cast(type).fill_missing();
}

} // namespace

Table reconcile_and_join(const Table &base, const Table &bonuses) {
  std::vector<std::string> stale;
  for (const auto &name : bonus_columns()) {
    if (base.has_column(name))
      stale.push_back(name);
  }
  Table left = base.drop(stale);

  std::vector<std::string> wanted = join_keys();
  for (const auto &name : bonus_columns())
    wanted.push_back(name);
  Table right = bonuses.select_existing(wanted);
  bool keyed = true;
  for (const auto &key : join_keys()) {
    const ColumnType lt = left.column(key).type;
    if (!right.has_column(key)) {
      keyed = false;
    } else if (right.column(key).type != lt) {
      right.add_column(right.column(key).cast(lt));
    }
  }

  // A bonus table without keys (no plays at all) adds zero columns only.
  Table joined = keyed ? left.left_join(right, join_keys()) : left;
  for (const auto &name : bonus_columns()) {
    joined.add_column(conform(joined, name, canonical_column_type(name)));
  }
  logger()->debug("Joined {} bonus rows onto {} stat rows", bonuses.row_count(),
                  base.row_count());
  return joined;
}

std::vector<std::pair<std::string, ColumnType>>
unified_schema(const std::vector<Table> &tables) {
  std::vector<std::string> order;
  std::unordered_map<std::string, ColumnType> seen;
  for (const auto &t : tables) {
    for (const auto &c : t.columns()) {
      auto it = seen.find(c.name);
      if (it == seen.end()) {
        order.push_back(c.name);
        it = seen.emplace(c.name, ColumnType::Null).first;
      }
      if (carries_data(c))
        it->second = widen(it->second, c.type);
    }
  }

  std::vector<std::pair<std::string, ColumnType>> schema;
  schema.reserve(order.size());
  for (const auto &name : order) {
    ColumnType t = seen[name];
    if (t == ColumnType::Null)
      t = canonical_column_type(name);
    schema.emplace_back(name, t);
  }
  return schema;
}

std::vector<Table> align_schemas(const std::vector<Table> &tables) {
  const auto schema = unified_schema(tables);
  std::vector<Table> out;
  out.reserve(tables.size());
  for (const auto &t : tables) {
    Table aligned;
    for (const auto &col : schema)
      aligned.add_column(conform(t, col.first, col.second));
    out.push_back(std::move(aligned));
  }
  return out;
}

Table concat_aligned(const std::vector<Table> &tables) {
  return Table::concat(align_schemas(tables));
}

} // namespace fantasy_core
