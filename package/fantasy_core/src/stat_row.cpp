#include "fantasy_core/stat_row.hpp"
#include "fantasy_core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace fantasy_core {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

template <class Stats> struct Field {
  const char *name;
  double Stats::*member;
  ColumnType type;
};

const std::vector<Field<OffenseStats>> &offense_fields() {
  using O = OffenseStats;
  static const std::vector<Field<O>> fields = {
      {"passing_yards", &O::passing_yards, ColumnType::Int64},
      {"passing_tds", &O::passing_tds, ColumnType::Int64},
      {"passing_interceptions", &O::passing_interceptions, ColumnType::Int64},
      {"passing_2pt_conversions", &O::passing_2pt_conversions,
       ColumnType::Int64},
      {"rushing_yards", &O::rushing_yards, ColumnType::Int64},
      {"rushing_tds", &O::rushing_tds, ColumnType::Int64},
      {"rushing_2pt_conversions", &O::rushing_2pt_conversions,
       ColumnType::Int64},
      {"receiving_yards", &O::receiving_yards, ColumnType::Int64},
      {"receptions", &O::receptions, ColumnType::Int64},
      {"receiving_tds", &O::receiving_tds, ColumnType::Int64},
      {"receiving_2pt_conversions", &O::receiving_2pt_conversions,
       ColumnType::Int64},
      {"special_teams_tds", &O::special_teams_tds, ColumnType::Int64},
      {"def_tds", &O::def_tds, ColumnType::Int64},
      {"fumble_recovery_tds", &O::fumble_recovery_tds, ColumnType::Int64},
      {"def_safeties", &O::def_safeties, ColumnType::Int64},
      {"rushing_fumbles_lost", &O::rushing_fumbles_lost, ColumnType::Int64},
      {"receiving_fumbles_lost", &O::receiving_fumbles_lost,
       ColumnType::Int64},
      {"sack_fumbles_lost", &O::sack_fumbles_lost, ColumnType::Int64},
      {"pass_td_40p", &O::pass_td_40p, ColumnType::Int64},
      {"pass_td_50p", &O::pass_td_50p, ColumnType::Int64},
      {"rush_td_40p", &O::rush_td_40p, ColumnType::Int64},
      {"rush_td_50p", &O::rush_td_50p, ColumnType::Int64},
      {"rec_td_40p", &O::rec_td_40p, ColumnType::Int64},
      {"rec_td_50p", &O::rec_td_50p, ColumnType::Int64},
  };
  return fields;
}

const std::vector<Field<KickerStats>> &kicker_fields() {
  using K = KickerStats;
  static const std::vector<Field<K>> fields = {
      {"pat_made", &K::pat_made, ColumnType::Int64},
      {"fg_made_0_19", &K::fg_made_0_19, ColumnType::Int64},
      {"fg_made_20_29", &K::fg_made_20_29, ColumnType::Int64},
      {"fg_made_30_39", &K::fg_made_30_39, ColumnType::Int64},
      {"fg_made_40_49", &K::fg_made_40_49, ColumnType::Int64},
      {"fg_made_50_59", &K::fg_made_50_59, ColumnType::Int64},
      {"fg_made_60_", &K::fg_made_60_, ColumnType::Int64},
      {"fg_missed_0_19", &K::fg_missed_0_19, ColumnType::Int64},
      {"fg_missed_20_29", &K::fg_missed_20_29, ColumnType::Int64},
      {"fg_missed_30_39", &K::fg_missed_30_39, ColumnType::Int64},
      {"fg_missed_40_49", &K::fg_missed_40_49, ColumnType::Int64},
      {"fg_missed_50_59", &K::fg_missed_50_59, ColumnType::Int64},
      {"fg_missed_60_", &K::fg_missed_60_, ColumnType::Int64},
      {"fg_missed", &K::fg_missed, ColumnType::Int64},
  };
  return fields;
}

const std::vector<Field<DstStats>> &dst_fields() {
  using D = DstStats;
  static const std::vector<Field<D>> fields = {
      {"sacks", &D::sacks, ColumnType::Float64},
      {"interceptions", &D::interceptions, ColumnType::Int64},
      {"fumbles_recovered", &D::fumbles_recovered, ColumnType::Int64},
      {"blocked_kicks", &D::blocked_kicks, ColumnType::Int64},
      {"safeties", &D::safeties, ColumnType::Int64},
      {"int_td", &D::int_td, ColumnType::Int64},
      {"fum_ret_td", &D::fum_ret_td, ColumnType::Int64},
      {"kr_td", &D::kr_td, ColumnType::Int64},
      {"pr_td", &D::pr_td, ColumnType::Int64},
      {"blk_kick_td", &D::blk_kick_td, ColumnType::Int64},
      {"two_pt_returns", &D::two_pt_returns, ColumnType::Int64},
      {"one_pt_safeties", &D::one_pt_safeties, ColumnType::Int64},
      {"points_allowed", &D::points_allowed, ColumnType::Int64},
      {"yards_allowed", &D::yards_allowed, ColumnType::Int64},
  };
  return fields;
}

template <class Stats>
std::vector<ColumnSpec> specs_of(const std::vector<Field<Stats>> &fields) {
  std::vector<ColumnSpec> out;
  out.reserve(fields.size());
  for (const auto &f : fields)
    out.push_back({f.name, f.type});
  return out;
}

template <class Stats>
Stats read_fields(const Table &table, std::size_t i,
                  const std::vector<Field<Stats>> &fields) {
  Stats s{};
  for (const auto &f : fields) {
    const int idx = table.find_column(f.name);
    if (idx < 0)
      continue;
    const Column &c = table.columns()[static_cast<std::size_t>(idx)];
    if (c.is_missing(i) || c.type == ColumnType::String)
      continue;
    s.*(f.member) = c.number_at(i);
  }
  return s;
}

std::string read_text(const Table &table, std::size_t i,
                      const std::string &name) {
  const int idx = table.find_column(name);
  if (idx < 0)
    return {};
  return table.columns()[static_cast<std::size_t>(idx)].text_at(i);
}

int read_int(const Table &table, std::size_t i, const std::string &name) {
  const int idx = table.find_column(name);
  if (idx < 0)
    return 0;
  const Column &c = table.columns()[static_cast<std::size_t>(idx)];
  if (c.type == ColumnType::String)
    return 0;
  return static_cast<int>(c.int_at(i));
}

Column column_from_doubles(const std::string &name, ColumnType type,
                           const std::vector<double> &v) {
  if (type == ColumnType::Int64) {
    std::vector<std::int64_t> ints(v.size());
    for (std::size_t i = 0; i < v.size(); ++i)
      ints[i] = static_cast<std::int64_t>(std::llround(v[i]));
    return Column::int64_column(name, std::move(ints));
  }
  return Column::float64_column(name, v);
}

template <class Stats>
void append_stat_columns(Table &out, const std::vector<StatRow> &rows,
                         const std::vector<Field<Stats>> &fields) {
  for (const auto &f : fields) {
    std::vector<double> v;
    v.reserve(rows.size());
    for (const auto &r : rows) {
      const Stats *s = std::get_if<Stats>(&r.stats);
      v.push_back(s ? (*s).*(f.member) : 0.0);
    }
    out.add_column(column_from_doubles(f.name, f.type, v));
  }
}

} // namespace

namespace {

bool match_position(const std::string &position, PositionClass &out) {
  const std::string p = upper(position);
  if (p == "QB") {
    out = PositionClass::QB;
  } else if (p == "RB") {
    out = PositionClass::RB;
  } else if (p == "WR" || p == "TE" || p == "WR/TE" || p == "WR_TE") {
    out = PositionClass::WR_TE;
  } else if (p == "K") {
    out = PositionClass::K;
  } else if (p == "DST" || p == "D/ST" || p == "DEF") {
    out = PositionClass::DST;
  } else {
    return false;
  }
  return true;
}

} // namespace

PositionClass position_class_from_string(const std::string &position) {
  PositionClass pc{};
  if (!match_position(position, pc))
    throw UnsupportedPositionError(position);
  return pc;
}

bool is_supported_position(const std::string &position) {
  PositionClass pc{};
  return match_position(position, pc);
}

const char *position_class_key(PositionClass pc) {
  switch (pc) {
  case PositionClass::QB:
    return "qb";
  case PositionClass::RB:
    return "rb";
  case PositionClass::WR_TE:
    return "wr_te";
  case PositionClass::K:
    return "k";
  case PositionClass::DST:
    return "dst";
  }
  return "qb";
}

const char *position_class_label(PositionClass pc) {
  switch (pc) {
  case PositionClass::QB:
    return "QB";
  case PositionClass::RB:
    return "RB";
  case PositionClass::WR_TE:
    return "WR/TE";
  case PositionClass::K:
    return "K";
  case PositionClass::DST:
    return "D/ST";
  }
  return "QB";
}

PositionClass StatRow::position_class() const {
  if (std::holds_alternative<DstStats>(stats))
    return PositionClass::DST;
  if (std::holds_alternative<KickerStats>(stats))
    return PositionClass::K;
  return position_class_from_string(key.position);
}

const std::vector<ColumnSpec> &player_key_columns() {
  static const std::vector<ColumnSpec> cols = {
      {"season", ColumnType::Int64},     {"week", ColumnType::Int64},
      {"player_id", ColumnType::String}, {"player_name", ColumnType::String},
      {"team", ColumnType::String},      {"position", ColumnType::String},
  };
  return cols;
}

const std::vector<ColumnSpec> &dst_key_columns() {
  static const std::vector<ColumnSpec> cols = {
      {"season", ColumnType::Int64},
      {"week", ColumnType::Int64},
      {"team", ColumnType::String},
  };
  return cols;
}

const std::vector<ColumnSpec> &stat_columns(PositionClass pc) {
  static const std::vector<ColumnSpec> offense = specs_of(offense_fields());
  static const std::vector<ColumnSpec> kicker = specs_of(kicker_fields());
  static const std::vector<ColumnSpec> dst = specs_of(dst_fields());
  switch (pc) {
  case PositionClass::K:
    return kicker;
  case PositionClass::DST:
    return dst;
  default:
    return offense;
  }
}

ColumnType canonical_column_type(const std::string &name) {
  static const std::unordered_map<std::string, ColumnType> registry = [] {
    std::unordered_map<std::string, ColumnType> m;
    for (const auto *cols : {&player_key_columns(), &dst_key_columns(),
                             &stat_columns(PositionClass::QB),
                             &stat_columns(PositionClass::K),
                             &stat_columns(PositionClass::DST)}) {
      for (const auto &c : *cols)
        m.emplace(c.name, c.type);
    }
    m.emplace("player_display_name", ColumnType::String);
    m.emplace("position_group", ColumnType::String);
    m.emplace("opponent_team", ColumnType::String);
    m.emplace("season_type", ColumnType::String);
    m.emplace("long_td_bonus", ColumnType::Float64);
    m.emplace("fantasy_points", ColumnType::Float64);
    return m;
  }();
  auto it = registry.find(name);
  return it == registry.end() ? ColumnType::Float64 : it->second;
}

StatRow row_from_table(const Table &table, std::size_t i, PositionClass pc) {
  StatRow row;
  row.key.season = read_int(table, i, "season");
  row.key.week = read_int(table, i, "week");
  row.key.team = read_text(table, i, "team");
  if (pc == PositionClass::DST) {
    row.key.player_id = row.key.team;
    row.key.player_name = row.key.team;
    row.key.position = "DST";
    row.stats = read_fields(table, i, dst_fields());
    return row;
  }
  row.key.player_id = read_text(table, i, "player_id");
  row.key.player_name = read_text(table, i, "player_name");
  row.key.position = read_text(table, i, "position");
  if (pc == PositionClass::K) {
    row.stats = read_fields(table, i, kicker_fields());
  } else {
    row.stats = read_fields(table, i, offense_fields());
  }
  return row;
}

Table rows_to_table(const std::vector<StatRow> &rows, PositionClass pc) {
  Table out;
  const auto &keys =
      pc == PositionClass::DST ? dst_key_columns() : player_key_columns();
  for (const auto &spec : keys) {
    if (spec.type == ColumnType::Int64) {
      std::vector<std::int64_t> v;
      v.reserve(rows.size());
      for (const auto &r : rows)
        v.push_back(spec.name == "season" ? r.key.season : r.key.week);
      out.add_column(Column::int64_column(spec.name, std::move(v)));
      continue;
    }
    std::vector<std::string> v;
    v.reserve(rows.size());
    for (const auto &r : rows) {
      if (spec.name == "team")
        v.push_back(r.key.team);
      else if (spec.name == "player_id")
        v.push_back(r.key.player_id);
      else if (spec.name == "player_name")
        v.push_back(r.key.player_name);
      else
        v.push_back(r.key.position);
    }
    out.add_column(Column::string_column(spec.name, std::move(v)));
  }
  switch (pc) {
  case PositionClass::K:
    append_stat_columns(out, rows, kicker_fields());
    break;
  case PositionClass::DST:
    append_stat_columns(out, rows, dst_fields());
    break;
  default:
    append_stat_columns(out, rows, offense_fields());
    break;
  }
  return out;
}

} // namespace fantasy_core
