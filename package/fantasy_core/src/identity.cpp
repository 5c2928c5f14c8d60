#include "fantasy_core/identity.hpp"
#include "fantasy_core/errors.hpp"
#include "fantasy_core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace fantasy_core {

void IdentityTable::add(const PlayerIdentity &p) {
  auto it = index_.find(p.canonical);
  if (it != index_.end()) {
    auto &aliases = identities_[it->second].aliases;
    for (const auto &a : p.aliases) {
      if (std::find(aliases.begin(), aliases.end(), a) == aliases.end())
        aliases.push_back(a);
    }
    return;
  }
  index_[p.canonical] = identities_.size();
  identities_.push_back(p);
}

const PlayerIdentity &IdentityTable::get(const std::string &canonical) const {
  auto it = index_.find(canonical);
  if (it == index_.end()) {
    throw std::out_of_range("IdentityTable: '" + canonical + "' not found");
  }
  return identities_.at(it->second);
}

IdentityTable IdentityTable::from_column(const Table &table,
                                         const std::string &column) {
  IdentityTable out;
  const int idx = table.find_column(column);
  if (idx < 0)
    return out;
  const Column &c = table.columns()[static_cast<std::size_t>(idx)];
  for (std::size_t i = 0; i < c.size(); ++i) {
    std::string name = c.text_at(i);
    if (!name.empty() && !out.has(name))
      out.add(PlayerIdentity(std::move(name)));
  }
  return out;
}

const IdentityTable &nfl_teams() {
  static const IdentityTable teams = [] {
    struct Team {
      const char *code, *city, *nickname;
    };
    static const Team kTeams[] = {
        {"ARI", "Arizona", "Cardinals"},   {"ATL", "Atlanta", "Falcons"},
        {"BAL", "Baltimore", "Ravens"},    {"BUF", "Buffalo", "Bills"},
        {"CAR", "Carolina", "Panthers"},   {"CHI", "Chicago", "Bears"},
        {"CIN", "Cincinnati", "Bengals"},  {"CLE", "Cleveland", "Browns"},
        {"DAL", "Dallas", "Cowboys"},      {"DEN", "Denver", "Broncos"},
        {"DET", "Detroit", "Lions"},       {"GB", "Green Bay", "Packers"},
        {"HOU", "Houston", "Texans"},      {"IND", "Indianapolis", "Colts"},
        {"JAX", "Jacksonville", "Jaguars"}, {"KC", "Kansas City", "Chiefs"},
        {"LA", "Los Angeles", "Rams"},     {"LAC", "Los Angeles", "Chargers"},
        {"LV", "Las Vegas", "Raiders"},    {"MIA", "Miami", "Dolphins"},
        {"MIN", "Minnesota", "Vikings"},   {"NE", "New England", "Patriots"},
        {"NO", "New Orleans", "Saints"},   {"NYG", "New York", "Giants"},
        {"NYJ", "New York", "Jets"},       {"PHI", "Philadelphia", "Eagles"},
        {"PIT", "Pittsburgh", "Steelers"}, {"SEA", "Seattle", "Seahawks"},
        {"SF", "San Francisco", "49ers"},  {"TB", "Tampa Bay", "Buccaneers"},
        {"TEN", "Tennessee", "Titans"},    {"WAS", "Washington", "Commanders"},
    };
    IdentityTable t;
    for (const auto &team : kTeams) {
      std::vector<std::string> aliases = {
          team.nickname, std::string(team.city) + " " + team.nickname};
      // Shared cities (LA, NY) would tie; only unique cities get an alias.
      const std::string city = team.city;
      if (city != "Los Angeles" && city != "New York")
        aliases.push_back(city);
      t.add(PlayerIdentity(team.code, std::move(aliases)));
    }
    t.add(PlayerIdentity("LA", {"LAR", "LA Rams"}));
    t.add(PlayerIdentity("LV", {"OAK", "Oakland Raiders"}));
    return t;
  }();
  return teams;
}

IdentityTable team_identities(const Table &dst) {
  const IdentityTable codes = IdentityTable::from_column(dst, "team");
  const IdentityTable &known = nfl_teams();
  IdentityTable out;
  for (const auto &c : codes.identities()) {
    out.add(known.has(c.canonical) ? known.get(c.canonical) : c);
  }
  return out;
}

namespace {

const std::unordered_set<std::string> &name_suffixes() {
  static const std::unordered_set<std::string> s = {"jr", "sr", "ii", "iii",
                                                    "iv", "v"};
  return s;
}

const std::unordered_map<std::string, std::string> &nicknames() {
  static const std::unordered_map<std::string, std::string> m = {
      {"alex", "alexander"},  {"ben", "benjamin"},     {"bill", "william"},
      {"bob", "robert"},      {"cam", "cameron"},      {"chris", "christopher"},
      {"dan", "daniel"},      {"danny", "daniel"},     {"dave", "david"},
      {"greg", "gregory"},    {"jake", "jacob"},       {"jim", "james"},
      {"jimmy", "james"},     {"joe", "joseph"},       {"jon", "jonathan"},
      {"josh", "joshua"},     {"ken", "kenneth"},      {"matt", "matthew"},
      {"mike", "michael"},    {"nick", "nicholas"},    {"pat", "patrick"},
      {"rob", "robert"},      {"sam", "samuel"},       {"steve", "steven"},
      {"tom", "thomas"},      {"tommy", "thomas"},     {"tony", "anthony"},
      {"will", "william"},    {"zach", "zachary"},     {"zack", "zachary"},
  };
  return m;
}

std::vector<std::string> tokens_of(const std::string &normalized) {
  std::vector<std::string> out;
  std::istringstream is(normalized);
  std::string tok;
  while (is >> tok)
    out.push_back(tok);
  return out;
}

std::string join(const std::vector<std::string> &tokens) {
  std::string out;
  for (const auto &t : tokens) {
    if (!out.empty())
      out.push_back(' ');
    out += t;
  }
  return out;
}

std::size_t lcs_length(const std::string &a, const std::string &b) {
  std::vector<std::size_t> prev(b.size() + 1, 0), cur(b.size() + 1, 0);
  for (std::size_t i = 1; i <= a.size(); ++i) {
    for (std::size_t j = 1; j <= b.size(); ++j) {
      cur[j] = (a[i - 1] == b[j - 1]) ? prev[j - 1] + 1
                                      : std::max(prev[j], cur[j - 1]);
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

// Indel-normalised similarity: 2 * LCS / (|a| + |b|).
double ratio(const std::string &a, const std::string &b) {
  if (a.empty() && b.empty())
    return 1.0;
  if (a.empty() || b.empty())
    return 0.0;
  return 2.0 * static_cast<double>(lcs_length(a, b)) /
         static_cast<double>(a.size() + b.size());
}

double normalized_similarity(const std::string &a, const std::string &b) {
  if (a.empty() || b.empty())
    return 0.0;
  if (a == b)
    return 1.0;

  double best = ratio(a, b);

  std::vector<std::string> ta = tokens_of(a), tb = tokens_of(b);
  std::vector<std::string> sa = ta, sb = tb;
  std::sort(sa.begin(), sa.end());
  std::sort(sb.begin(), sb.end());
  best = std::max(best, ratio(join(sa), join(sb)));

  // Partial names: every query token against its closest candidate token.
  double partial = 0.0;
  for (const auto &qa : ta) {
    double tok_best = 0.0;
    for (const auto &cb : tb)
      tok_best = std::max(tok_best, ratio(qa, cb));
    partial += tok_best;
  }
  if (!ta.empty())
    best = std::max(best, 0.9 * partial / static_cast<double>(ta.size()));
  return std::min(best, 1.0);
}

double identity_score(const std::string &normalized_query,
                      const PlayerIdentity &id, bool &exact) {
  exact = false;
  double best = 0.0;
  auto consider = [&](const std::string &name) {
    const std::string n = normalize_name(name);
    if (n.empty())
      return;
    if (n == normalized_query)
      exact = true;
    best = std::max(best, normalized_similarity(normalized_query, n));
  };
  consider(id.canonical);
  for (const auto &a : id.aliases)
    consider(a);
  return best;
}

} // namespace

std::string normalize_name(const std::string &name) {
  std::string cleaned;
  cleaned.reserve(name.size());
  for (unsigned char ch : name) {
    if (std::isalnum(ch)) {
      cleaned.push_back(static_cast<char>(std::tolower(ch)));
    } else if (ch == '\'' || ch == '.') {
      continue;
    } else {
      cleaned.push_back(' ');
    }
  }
  std::vector<std::string> toks = tokens_of(cleaned);
  while (toks.size() > 1 && name_suffixes().count(toks.back()))
    toks.pop_back();
  const auto &nick = nicknames();
  for (auto &t : toks) {
    auto it = nick.find(t);
    if (it != nick.end())
      t = it->second;
  }
  return join(toks);
}

double name_similarity(const std::string &a, const std::string &b) {
  return normalized_similarity(normalize_name(a), normalize_name(b));
}

std::vector<Match> resolve(const std::string &query,
                           const IdentityTable &candidates, double cutoff) {
  const std::string q = normalize_name(query);
  std::vector<Match> exact_hits, scored;
  if (q.empty())
    return scored;
  for (const auto &id : candidates.identities()) {
    bool exact = false;
    const double s = identity_score(q, id, exact);
    if (exact) {
      exact_hits.push_back({id.canonical, 1.0});
    } else if (s >= cutoff) {
      scored.push_back({id.canonical, s});
    }
  }
  if (!exact_hits.empty())
    return exact_hits;
  std::stable_sort(scored.begin(), scored.end(),
                   [](const Match &a, const Match &b) {
                     if (a.score != b.score)
                       return a.score > b.score;
                     return a.canonical < b.canonical;
                   });
  return scored;
}

Match resolve_one(const std::string &query, const IdentityTable &candidates,
                  double cutoff) {
  std::vector<Match> matches = resolve(query, candidates, cutoff);
  if (matches.empty())
    throw NoMatchError(query);
  return matches.front();
}

Resolution resolve_all(const std::vector<std::string> &queries,
                       const IdentityTable &candidates, double cutoff,
                       const std::string &kind) {
  Resolution out;
  for (const auto &q : queries) {
    const std::vector<Match> matches = resolve(q, candidates, cutoff);
    if (matches.empty()) {
      logger()->warn("No {} found matching '{}', skipping", kind, q);
      out.unmatched.push_back(q);
      continue;
    }
    const Match &m = matches.front();
    logger()->info("Found {}: {} (score {:.2f})", kind, m.canonical, m.score);
    if (std::find(out.matched.begin(), out.matched.end(), m.canonical) ==
        out.matched.end())
      out.matched.push_back(m.canonical);
  }
  return out;
}

} // namespace fantasy_core
