#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace fantasy_core {

class FantasyError : public std::runtime_error {
public:
  explicit FantasyError(const std::string &message)
      : std::runtime_error(message) {}
};

// Column name/type/order mismatch during a join or concatenation. Reaching a
// caller means the reconciliation step missed a case.
class SchemaError : public FantasyError {
public:
  explicit SchemaError(const std::string &message)
      : FantasyError("Schema error: " + message) {}
};

// A row's position class has no scoring formula.
class UnsupportedPositionError : public FantasyError {
public:
  explicit UnsupportedPositionError(const std::string &position)
      : FantasyError("Unsupported position: '" + position + "'"),
        position_(position) {}

  const std::string &position() const { return position_; }

private:
  std::string position_;
};

// An identity query matched nothing above the similarity cutoff.
class NoMatchError : public FantasyError {
public:
  explicit NoMatchError(const std::string &query)
      : FantasyError("No match for '" + query + "'"), query_(query) {}

  const std::string &query() const { return query_; }

private:
  std::string query_;
};

// Malformed season/week/name filter text; raised before any data is touched.
class FilterSpecError : public FantasyError {
public:
  FilterSpecError(const std::string &message, std::string token)
      : FantasyError(message + ": '" + token + "'"), token_(std::move(token)) {}

  const std::string &token() const { return token_; }

private:
  std::string token_;
};

} // namespace fantasy_core
