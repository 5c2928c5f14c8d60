#pragma once

#include <string>
#include <utility>
#include <vector>

#include "fantasy_core/table.hpp"

namespace fantasy_core {

// Left-joins a bonus table onto base statistics on (season, week,
// player_id). Bonus columns already on `base` are dropped first; rows
// without a bonus get 0 in every bonus column.
Table reconcile_and_join(const Table &base, const Table &bonuses);

// Declared type of each column across `tables`, in canonical order (first
// table's columns, then new names in encounter order). Types come from
// columns that carry data: int64 with float64 widens to float64, anything
// with string widens to string. A name with no data anywhere takes
// canonical_column_type().
std::vector<std::pair<std::string, ColumnType>>
unified_schema(const std::vector<Table> &tables);

// Rewrites every table to unified_schema(): absent or all-missing columns
// become typed defaults (0, 0.0, ""), narrower columns are cast up, missing
// cells are filled. Never throws for schema differences.
std::vector<Table> align_schemas(const std::vector<Table> &tables);

// align_schemas followed by Table::concat.
Table concat_aligned(const std::vector<Table> &tables);

} // namespace fantasy_core
