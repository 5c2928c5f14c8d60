#include "fantasy_core/table.hpp"
#include "fantasy_core/errors.hpp"

#include <algorithm>
#include <numeric>
#include <type_traits>
#include <unordered_map>

#include <fmt/format.h>

namespace fantasy_core {

const char *column_type_name(ColumnType t) {
  switch (t) {
  case ColumnType::Null:
    return "null";
  case ColumnType::Int64:
    return "int64";
  case ColumnType::Float64:
    return "float64";
  case ColumnType::String:
    return "string";
  }
  return "null";
}

Column Column::null_column(std::string name, std::size_t n) {
  Column c;
  c.name = std::move(name);
  c.type = ColumnType::Null;
  c.values = std::monostate{};
  c.missing.assign(n, 1);
  return c;
}

Column Column::int64_column(std::string name, std::vector<std::int64_t> v) {
  Column c;
  c.name = std::move(name);
  c.type = ColumnType::Int64;
  c.missing.assign(v.size(), 0);
  c.values = std::move(v);
  return c;
}

Column Column::float64_column(std::string name, std::vector<double> v) {
  Column c;
  c.name = std::move(name);
  c.type = ColumnType::Float64;
  c.missing.assign(v.size(), 0);
  c.values = std::move(v);
  return c;
}

Column Column::string_column(std::string name, std::vector<std::string> v) {
  Column c;
  c.name = std::move(name);
  c.type = ColumnType::String;
  c.missing.assign(v.size(), 0);
  c.values = std::move(v);
  return c;
}

Column Column::filled(std::string name, ColumnType type, std::size_t n) {
  switch (type) {
  case ColumnType::Int64:
    return int64_column(std::move(name), std::vector<std::int64_t>(n, 0));
  case ColumnType::Float64:
    return float64_column(std::move(name), std::vector<double>(n, 0.0));
  case ColumnType::String:
    return string_column(std::move(name), std::vector<std::string>(n));
  case ColumnType::Null:
    break;
  }
  return null_column(std::move(name), n);
}

bool Column::all_missing() const {
  return std::all_of(missing.begin(), missing.end(),
                     [](std::uint8_t m) { return m != 0; });
}

bool Column::any_missing() const {
  return std::any_of(missing.begin(), missing.end(),
                     [](std::uint8_t m) { return m != 0; });
}

double Column::number_at(std::size_t i) const {
  if (is_missing(i))
    return 0.0;
  switch (type) {
  case ColumnType::Int64:
    return static_cast<double>(std::get<std::vector<std::int64_t>>(values)[i]);
  case ColumnType::Float64:
    return std::get<std::vector<double>>(values)[i];
  case ColumnType::Null:
    return 0.0;
  case ColumnType::String:
    break;
  }
  throw SchemaError(
      fmt::format("column '{}' is string, expected a number", name));
}

std::int64_t Column::int_at(std::size_t i) const {
  if (type == ColumnType::Int64) {
    return is_missing(i) ? 0
                         : std::get<std::vector<std::int64_t>>(values)[i];
  }
  return static_cast<std::int64_t>(number_at(i));
}

const std::string &Column::string_at(std::size_t i) const {
  if (type != ColumnType::String) {
    throw SchemaError(fmt::format("column '{}' is {}, expected string", name,
                                  column_type_name(type)));
  }
  return std::get<std::vector<std::string>>(values)[i];
}

std::string Column::text_at(std::size_t i) const {
  if (is_missing(i))
    return {};
  switch (type) {
  case ColumnType::Int64:
    return fmt::format("{}", std::get<std::vector<std::int64_t>>(values)[i]);
  case ColumnType::Float64:
    return fmt::format("{}", std::get<std::vector<double>>(values)[i]);
  case ColumnType::String:
    return std::get<std::vector<std::string>>(values)[i];
  case ColumnType::Null:
    break;
  }
  return {};
}

Column Column::take(const std::vector<std::size_t> &rows) const {
  Column out;
  out.name = name;
  out.type = type;
  out.missing.reserve(rows.size());
  for (std::size_t r : rows)
    out.missing.push_back(missing.at(r));
  std::visit(
      [&](const auto &vec) {
        using V = std::decay_t<decltype(vec)>;
        if constexpr (std::is_same_v<V, std::monostate>) {
          out.values = std::monostate{};
        } else {
          V picked;
          picked.reserve(rows.size());
          for (std::size_t r : rows)
            picked.push_back(vec[r]);
          out.values = std::move(picked);
        }
      },
      values);
  return out;
}

Column Column::cast(ColumnType to) const {
  if (to == type)
    return *this;
  const std::size_t n = size();
  if (type == ColumnType::Null) {
    Column out = filled(name, to, n);
    out.missing = missing;
    return out;
  }
  if (type == ColumnType::Int64 && to == ColumnType::Float64) {
    const auto &src = std::get<std::vector<std::int64_t>>(values);
    std::vector<double> dst(src.begin(), src.end());
    Column out = float64_column(name, std::move(dst));
    out.missing = missing;
    return out;
  }
  if (to == ColumnType::String) {
    std::vector<std::string> dst(n);
    for (std::size_t i = 0; i < n; ++i)
      dst[i] = text_at(i);
    Column out = string_column(name, std::move(dst));
    out.missing = missing;
    return out;
  }
  throw SchemaError(fmt::format("cannot cast column '{}' from {} to {}", name,
                                column_type_name(type),
                                column_type_name(to)));
}

Column Column::fill_missing() const {
  if (type == ColumnType::Null)
    return *this;
  Column out = *this;
  std::visit(
      [&](auto &vec) {
        using V = std::decay_t<decltype(vec)>;
        if constexpr (!std::is_same_v<V, std::monostate>) {
          for (std::size_t i = 0; i < vec.size(); ++i) {
            if (out.missing[i])
              vec[i] = typename V::value_type{};
          }
        }
      },
      out.values);
  std::fill(out.missing.begin(), out.missing.end(), 0);
  return out;
}

void Column::set_missing(std::size_t i) {
  missing.at(i) = 1;
  std::visit(
      [i](auto &vec) {
        using V = std::decay_t<decltype(vec)>;
        if constexpr (!std::is_same_v<V, std::monostate>)
          vec[i] = typename V::value_type{};
      },
      values);
}

std::vector<std::string> Table::column_names() const {
  std::vector<std::string> out;
  out.reserve(columns_.size());
  for (const auto &c : columns_)
    out.push_back(c.name);
  return out;
}

int Table::find_column(const std::string &name) const {
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i].name == name)
      return static_cast<int>(i);
  }
  return -1;
}

const Column &Table::column(const std::string &name) const {
  const int idx = find_column(name);
  if (idx < 0)
    throw SchemaError(fmt::format("no column named '{}'", name));
  return columns_[static_cast<std::size_t>(idx)];
}

void Table::add_column(Column col) {
  if (columns_.empty()) {
    rows_ = col.size();
  } else if (col.size() != rows_) {
    throw SchemaError(fmt::format("column '{}' has {} rows, table has {}",
                                  col.name, col.size(), rows_));
  }
  const int idx = find_column(col.name);
  if (idx >= 0) {
    columns_[static_cast<std::size_t>(idx)] = std::move(col);
  } else {
    columns_.push_back(std::move(col));
  }
}

Table Table::with_column(Column col) const {
  Table out = *this;
  out.add_column(std::move(col));
  return out;
}

Table Table::drop(const std::vector<std::string> &names) const {
  Table out;
  out.rows_ = rows_;
  for (const auto &c : columns_) {
    if (std::find(names.begin(), names.end(), c.name) == names.end())
      out.columns_.push_back(c);
  }
  return out;
}

Table Table::rename(const std::string &from, const std::string &to) const {
  if (from == to)
    return *this;
  if (has_column(to))
    throw SchemaError(fmt::format("rename target '{}' already exists", to));
  Table out = *this;
  const int idx = out.find_column(from);
  if (idx < 0)
    throw SchemaError(fmt::format("no column named '{}'", from));
  out.columns_[static_cast<std::size_t>(idx)].name = to;
  return out;
}

Table Table::select(const std::vector<std::string> &names) const {
  Table out;
  out.rows_ = rows_;
  for (const auto &n : names)
    out.columns_.push_back(column(n));
  return out;
}

Table Table::select_existing(const std::vector<std::string> &names) const {
  Table out;
  out.rows_ = rows_;
  for (const auto &n : names) {
    const int idx = find_column(n);
    if (idx >= 0)
      out.columns_.push_back(columns_[static_cast<std::size_t>(idx)]);
  }
  return out;
}

Table Table::filter(const MissingMask &keep) const {
  if (keep.size() != rows_) {
    throw SchemaError(fmt::format("filter mask has {} entries, table has {}",
                                  keep.size(), rows_));
  }
  std::vector<std::size_t> rows;
  for (std::size_t i = 0; i < keep.size(); ++i) {
    if (keep[i])
      rows.push_back(i);
  }
  return take(rows);
}

Table Table::take(const std::vector<std::size_t> &rows) const {
  Table out;
  out.rows_ = rows.size();
  out.columns_.reserve(columns_.size());
  for (const auto &c : columns_)
    out.columns_.push_back(c.take(rows));
  return out;
}

Table Table::head(std::size_t n) const {
  std::vector<std::size_t> rows(std::min(n, rows_));
  std::iota(rows.begin(), rows.end(), std::size_t{0});
  return take(rows);
}

namespace {

// <0, 0, >0 for a < b, a == b, a > b. Missing sorts after any value.
int compare_cells(const Column &c, std::size_t a, std::size_t b) {
  const bool ma = c.is_missing(a), mb = c.is_missing(b);
  if (ma || mb)
    return static_cast<int>(ma) - static_cast<int>(mb);
  switch (c.type) {
  case ColumnType::Int64: {
    const auto &v = std::get<std::vector<std::int64_t>>(c.values);
    return (v[a] < v[b]) ? -1 : (v[b] < v[a] ? 1 : 0);
  }
  case ColumnType::Float64: {
    const auto &v = std::get<std::vector<double>>(c.values);
    return (v[a] < v[b]) ? -1 : (v[b] < v[a] ? 1 : 0);
  }
  case ColumnType::String: {
    const auto &v = std::get<std::vector<std::string>>(c.values);
    return v[a].compare(v[b]);
  }
  case ColumnType::Null:
    break;
  }
  return 0;
}

std::string key_of(const std::vector<const Column *> &cols, std::size_t row) {
  std::string key;
  for (const Column *c : cols) {
    key += c->is_missing(row) ? std::string("\x01") : c->text_at(row);
    key.push_back('\x1f');
  }
  return key;
}

} // namespace

Table Table::sort_by(const std::vector<std::string> &keys,
                     bool descending) const {
  std::vector<const Column *> cols;
  cols.reserve(keys.size());
  for (const auto &k : keys)
    cols.push_back(&column(k));
  std::vector<std::size_t> order(rows_);
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) {
                     for (const Column *c : cols) {
                       int cmp = compare_cells(*c, a, b);
                       if (descending && !c->is_missing(a) &&
                           !c->is_missing(b))
                         cmp = -cmp;
                       if (cmp != 0)
                         return cmp < 0;
                     }
                     return false;
                   });
  return take(order);
}

Table Table::left_join(const Table &right,
                       const std::vector<std::string> &on) const {
  std::vector<const Column *> lkeys, rkeys;
  for (const auto &k : on) {
    const Column &lc = column(k);
    const Column &rc = right.column(k);
    if (lc.type != rc.type) {
      throw SchemaError(fmt::format(
          "join key '{}' is {} on the left but {} on the right", k,
          column_type_name(lc.type), column_type_name(rc.type)));
    }
    lkeys.push_back(&lc);
    rkeys.push_back(&rc);
  }
  for (const auto &rc : right.columns_) {
    if (std::find(on.begin(), on.end(), rc.name) == on.end() &&
        has_column(rc.name)) {
      throw SchemaError(
          fmt::format("join would duplicate non-key column '{}'", rc.name));
    }
  }

  std::unordered_map<std::string, std::vector<std::size_t>> index;
  for (std::size_t r = 0; r < right.rows_; ++r)
    index[key_of(rkeys, r)].push_back(r);

  std::vector<std::size_t> left_rows;
  std::vector<std::size_t> right_rows;
  MissingMask unmatched;
  for (std::size_t l = 0; l < rows_; ++l) {
    auto it = index.find(key_of(lkeys, l));
    if (it == index.end()) {
      left_rows.push_back(l);
      right_rows.push_back(0);
      unmatched.push_back(1);
      continue;
    }
    for (std::size_t r : it->second) {
      left_rows.push_back(l);
      right_rows.push_back(r);
      unmatched.push_back(0);
    }
  }

  Table out = take(left_rows);
  for (const auto &rc : right.columns_) {
    if (std::find(on.begin(), on.end(), rc.name) != on.end())
      continue;
    Column joined;
    if (right.rows_ == 0) {
      joined = Column::filled(rc.name, rc.type, left_rows.size());
      std::fill(joined.missing.begin(), joined.missing.end(), 1);
    } else {
      joined = rc.take(right_rows);
      for (std::size_t i = 0; i < unmatched.size(); ++i) {
        if (unmatched[i])
          joined.set_missing(i);
      }
    }
    out.add_column(std::move(joined));
  }
  return out;
}

Table Table::concat(const std::vector<Table> &tables) {
  if (tables.empty())
    return Table{};
  const Table &first = tables.front();
  Table out = first;
  for (std::size_t t = 1; t < tables.size(); ++t) {
    const Table &next = tables[t];
    if (next.columns_.size() != first.columns_.size()) {
      throw SchemaError(fmt::format(
          "concat: table {} has {} columns, expected {} ({} vs {})", t,
          next.columns_.size(), first.columns_.size(), next.schema_string(),
          first.schema_string()));
    }
    for (std::size_t c = 0; c < first.columns_.size(); ++c) {
      const Column &a = first.columns_[c];
      const Column &b = next.columns_[c];
      if (a.name != b.name || a.type != b.type) {
        throw SchemaError(fmt::format(
            "concat: column {} is '{}' ({}) in table {} but '{}' ({}) in "
            "table 0",
            c, b.name, column_type_name(b.type), t, a.name,
            column_type_name(a.type)));
      }
    }
    for (std::size_t c = 0; c < out.columns_.size(); ++c) {
      Column &dst = out.columns_[c];
      const Column &src = next.columns_[c];
      dst.missing.insert(dst.missing.end(), src.missing.begin(),
                         src.missing.end());
      std::visit(
          [&](auto &vec) {
            using V = std::decay_t<decltype(vec)>;
            if constexpr (!std::is_same_v<V, std::monostate>) {
              const auto &more = std::get<V>(src.values);
              vec.insert(vec.end(), more.begin(), more.end());
            }
          },
          dst.values);
    }
    out.rows_ += next.rows_;
  }
  return out;
}

std::vector<std::pair<std::string, ColumnType>> Table::schema() const {
  std::vector<std::pair<std::string, ColumnType>> out;
  out.reserve(columns_.size());
  for (const auto &c : columns_)
    out.emplace_back(c.name, c.type);
  return out;
}

std::string Table::schema_string() const {
  std::string s = "{";
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (i)
      s += ", ";
    s += fmt::format("{}: {}", columns_[i].name,
                     column_type_name(columns_[i].type));
  }
  s += "}";
  return s;
}

} // namespace fantasy_core
