#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "fantasy_core/table.hpp"

namespace fantasy_core {

// The league's historic cutoff was 60 on a 0-100 scale.
constexpr double kDefaultNameCutoff = 0.60;

struct PlayerIdentity {
  std::string canonical;
  std::vector<std::string> aliases;

  PlayerIdentity() = default;
  PlayerIdentity(std::string canonical_, std::vector<std::string> aliases_ = {})
      : canonical(std::move(canonical_)), aliases(std::move(aliases_)) {}
};

class IdentityTable {
public:
  IdentityTable() = default;

  // Re-adding a canonical name merges the alias lists.
  void add(const PlayerIdentity &p);

  std::size_t size() const { return identities_.size(); }

  bool has(const std::string &canonical) const {
    return index_.find(canonical) != index_.end();
  }

  const PlayerIdentity &get(const std::string &canonical) const;

  const std::vector<PlayerIdentity> &identities() const { return identities_; }

  // Distinct non-empty values of a string column, in first-seen order.
  static IdentityTable from_column(const Table &table,
                                   const std::string &column);

private:
  std::vector<PlayerIdentity> identities_;
  std::unordered_map<std::string, std::size_t> index_;
};

// All 32 franchises keyed by the provider's team code, with city and
// nickname aliases ("BUF": "Buffalo", "Bills", "Buffalo Bills").
const IdentityTable &nfl_teams();
// Team codes present in a D/ST table, with aliases from nfl_teams() where
// the code is known.
IdentityTable team_identities(const Table &dst);

// Lower-case, drop apostrophes and periods, split on other punctuation,
// strip generational suffixes and expand common nicknames.
std::string normalize_name(const std::string &name);

// Similarity of two raw names in [0, 1]: the best of whole-string,
// token-sorted and (scaled by 0.9) per-token partial matching.
double name_similarity(const std::string &a, const std::string &b);

struct Match {
  std::string canonical;
  double score{0.0};
};

// Candidates scoring >= cutoff, best first (ties by name). An exact
// normalized hit on a canonical name or alias returns only the exact hits,
// each at 1.0.
std::vector<Match> resolve(const std::string &query,
                           const IdentityTable &candidates,
                           double cutoff = kDefaultNameCutoff);

// Best match, or NoMatchError.
Match resolve_one(const std::string &query, const IdentityTable &candidates,
                  double cutoff = kDefaultNameCutoff);

struct Resolution {
  std::vector<std::string> matched; // canonical names, query order, no dups
  std::vector<std::string> unmatched; // queries that found nothing
};

// Resolves each query independently. Unmatched queries are logged and
// skipped; the call never throws for a miss.
Resolution resolve_all(const std::vector<std::string> &queries,
                       const IdentityTable &candidates,
                       double cutoff = kDefaultNameCutoff,
                       const std::string &kind = "player");

} // namespace fantasy_core
