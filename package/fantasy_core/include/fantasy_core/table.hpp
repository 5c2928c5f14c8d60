#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace fantasy_core {

// Null is the type of a column that never carried a value. It cannot be
// concatenated with a typed column of the same name.
enum class ColumnType { Null, Int64, Float64, String };

const char *column_type_name(ColumnType t);

using ColumnStorage =
    std::variant<std::monostate, std::vector<std::int64_t>,
                 std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<std::uint8_t>;

struct Column {
  std::string name;
  ColumnType type{ColumnType::Null};
  ColumnStorage values{};
  MissingMask missing; // 1 = missing; length is the row count

  Column() = default;

  static Column null_column(std::string name, std::size_t n);
  static Column int64_column(std::string name, std::vector<std::int64_t> v);
  static Column float64_column(std::string name, std::vector<double> v);
  static Column string_column(std::string name, std::vector<std::string> v);
  // n rows of the type's default value (0, 0.0, ""), none missing.
  static Column filled(std::string name, ColumnType type, std::size_t n);

  std::size_t size() const { return missing.size(); }
  bool is_missing(std::size_t i) const { return missing[i] != 0; }
  bool all_missing() const;
  bool any_missing() const;

  // Numeric read; missing cells and Null columns read as 0.
  double number_at(std::size_t i) const;
  std::int64_t int_at(std::size_t i) const;
  // String read; throws SchemaError on a non-string column.
  const std::string &string_at(std::size_t i) const;
  // Display form of a cell ("" when missing).
  std::string text_at(std::size_t i) const;

  Column take(const std::vector<std::size_t> &rows) const;
  // Widening cast. Null casts to anything, Int64 to Float64, and anything to
  // String. Other directions throw SchemaError.
  Column cast(ColumnType to) const;
  // Replaces missing cells with the type's default and clears the mask.
  Column fill_missing() const;

  void set_missing(std::size_t i);
};

class Table {
public:
  Table() = default;

  std::size_t row_count() const { return rows_; }
  std::size_t column_count() const { return columns_.size(); }
  bool empty() const { return rows_ == 0; }

  const std::vector<Column> &columns() const { return columns_; }
  std::vector<std::string> column_names() const;

  int find_column(const std::string &name) const;
  bool has_column(const std::string &name) const {
    return find_column(name) >= 0;
  }
  const Column &column(const std::string &name) const;

  // Appends or replaces a column in place. The first column fixes the row
  // count; later columns must match it.
  void add_column(Column col);

  Table with_column(Column col) const;
  Table drop(const std::vector<std::string> &names) const;
  Table rename(const std::string &from, const std::string &to) const;
  // Projects onto the given names in that order; throws on an absent name.
  Table select(const std::vector<std::string> &names) const;
  // Same as select but silently skips absent names.
  Table select_existing(const std::vector<std::string> &names) const;

  Table filter(const MissingMask &keep) const;
  Table take(const std::vector<std::size_t> &rows) const;
  Table head(std::size_t n) const;

  // Stable ascending sort on the given keys, missing cells last. Use
  // `descending` to flip every key.
  Table sort_by(const std::vector<std::string> &keys,
                bool descending = false) const;

  // Left join on equal key cells. Right-side rows that match several times
  // duplicate the left row; unmatched rows get missing cells. A non-key name
  // present on both sides throws SchemaError.
  Table left_join(const Table &right, const std::vector<std::string> &on) const;

  // Strict vertical union: every table must carry identical column names,
  // types and order. Anything else throws SchemaError.
  static Table concat(const std::vector<Table> &tables);

  std::vector<std::pair<std::string, ColumnType>> schema() const;
  std::string schema_string() const;

private:
  std::size_t rows_{0};
  std::vector<Column> columns_;
};

} // namespace fantasy_core
