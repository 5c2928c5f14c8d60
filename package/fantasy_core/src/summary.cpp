#include "fantasy_core/summary.hpp"
#include "fantasy_core/logging.hpp"
#include "fantasy_core/report.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <utility>

namespace fantasy_core {

bool is_rate_column(const std::string &name) {
  static const char *kMarkers[] = {"_pct", "pct_", "share", "epa",  "cpoe",
                                   "pacr", "racr", "wopr",  "dakota"};
  for (const char *m : kMarkers) {
    if (name.find(m) != std::string::npos)
      return true;
  }
  return false;
}

namespace {

struct RowOrder {
  const Column *season{nullptr};
  const Column *week{nullptr};

  explicit RowOrder(const Table &t) {
    if (t.has_column("season"))
      season = &t.column("season");
    if (t.has_column("week"))
      week = &t.column("week");
  }

  std::pair<std::int64_t, std::int64_t> at(std::size_t i) const {
    return {season ? season->int_at(i) : 0, week ? week->int_at(i) : 0};
  }

  // Latest first; ties keep table order.
  void sort_recent_first(std::vector<std::size_t> &rows) const {
    std::stable_sort(
        rows.begin(), rows.end(),
        [&](std::size_t a, std::size_t b) { return at(a) > at(b); });
  }
};

double median_of(std::vector<double> v) {
  if (v.empty())
    return 0.0;
  std::sort(v.begin(), v.end());
  const std::size_t mid = v.size() / 2;
  if (v.size() % 2 == 1)
    return v[mid];
  return 0.5 * (v[mid - 1] + v[mid]);
}

Eigen::VectorXd points_of(const Column &fp,
                          const std::vector<std::size_t> &rows) {
  Eigen::VectorXd v(static_cast<Eigen::Index>(rows.size()));
  for (std::size_t i = 0; i < rows.size(); ++i)
    v[static_cast<Eigen::Index>(i)] = fp.number_at(rows[i]);
  return v;
}

std::vector<std::size_t> rows_matching(const Column &id,
                                       const std::string &name) {
  std::vector<std::size_t> rows;
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (!id.is_missing(i) && id.text_at(i) == name)
      rows.push_back(i);
  }
  return rows;
}

void add_summary_columns(Table &out, const std::string &prefix,
                         const std::vector<PointSummary> &s) {
  auto ints = [&](const char *name, int PointSummary::*m) {
    std::vector<std::int64_t> v;
    v.reserve(s.size());
    for (const auto &x : s)
      v.push_back(x.*m);
    out.add_column(Column::int64_column(prefix + name, std::move(v)));
  };
  auto doubles = [&](const char *name, double PointSummary::*m) {
    std::vector<double> v;
    v.reserve(s.size());
    for (const auto &x : s)
      v.push_back(x.*m);
    out.add_column(Column::float64_column(prefix + name, std::move(v)));
  };
  ints("num_games", &PointSummary::games);
  doubles("mean_points", &PointSummary::mean);
  doubles("median_points", &PointSummary::median);
  doubles("max_points", &PointSummary::max);
  doubles("min_points", &PointSummary::min);
  doubles("stddev_points", &PointSummary::stddev);
  doubles("mad_points", &PointSummary::mad);
  ints("nuclear_games", &PointSummary::nuclear);
  ints("boom_games", &PointSummary::boom);
  ints("bust_games", &PointSummary::bust);
}

} // namespace

Table aggregate(const Table &rows, const std::string &group_key) {
  const Column &key = rows.column(group_key);
  const RowOrder order(rows);

  std::vector<std::string> names;
  std::unordered_map<std::string, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < rows.row_count(); ++i) {
    const std::string k = key.text_at(i);
    if (k.empty())
      continue;
    auto it = groups.find(k);
    if (it == groups.end()) {
      names.push_back(k);
      it = groups.emplace(k, std::vector<std::size_t>{}).first;
    }
    it->second.push_back(i);
  }

  std::vector<std::size_t> latest;
  latest.reserve(names.size());
  for (const auto &n : names) {
    std::vector<std::size_t> g = groups[n];
    order.sort_recent_first(g);
    latest.push_back(g.front());
  }

  Table out;
  out.add_column(Column::string_column(group_key, names));
  for (const auto &c : rows.columns()) {
    if (c.name == group_key || c.type != ColumnType::String)
      continue;
    std::vector<std::string> v;
    v.reserve(latest.size());
    for (std::size_t r : latest)
      v.push_back(c.text_at(r));
    out.add_column(Column::string_column(c.name, std::move(v)));
  }

  std::vector<std::int64_t> games;
  games.reserve(names.size());
  for (const auto &n : names)
    games.push_back(static_cast<std::int64_t>(groups[n].size()));
  out.add_column(Column::int64_column("games", std::move(games)));

  for (const auto &c : rows.columns()) {
    if (c.name == group_key || c.name == "season" || c.name == "week" ||
        c.type == ColumnType::String || c.type == ColumnType::Null)
      continue;
    if (is_rate_column(c.name)) {
      std::vector<double> v;
      v.reserve(names.size());
      for (const auto &n : names) {
        double sum = 0.0;
        int seen = 0;
        for (std::size_t r : groups[n]) {
          if (c.is_missing(r))
            continue;
          sum += c.number_at(r);
          ++seen;
        }
        v.push_back(seen > 0 ? sum / seen : 0.0);
      }
      out.add_column(Column::float64_column(c.name, std::move(v)));
    } else if (c.type == ColumnType::Int64) {
      std::vector<std::int64_t> v;
      v.reserve(names.size());
      for (const auto &n : names) {
        std::int64_t sum = 0;
        for (std::size_t r : groups[n])
          sum += c.int_at(r);
        v.push_back(sum);
      }
      out.add_column(Column::int64_column(c.name, std::move(v)));
    } else {
      std::vector<double> v;
      v.reserve(names.size());
      for (const auto &n : names)
        v.push_back(points_of(c, groups[n]).sum());
      out.add_column(Column::float64_column(c.name, std::move(v)));
    }
  }
  return out;
}

PointSummary summarize_points(const Eigen::VectorXd &points) {
  PointSummary s;
  const Eigen::Index n = points.size();
  if (n == 0)
    return s;
  s.games = static_cast<int>(n);
  s.mean = points.mean();
  s.max = points.maxCoeff();
  s.min = points.minCoeff();
  s.median = median_of(std::vector<double>(points.data(), points.data() + n));
  if (n > 1) {
    s.stddev = std::sqrt((points.array() - s.mean).square().sum() /
                         static_cast<double>(n - 1));
  }
  const Eigen::VectorXd dev = (points.array() - s.median).abs().matrix();
  s.mad = median_of(std::vector<double>(dev.data(), dev.data() + n));
  s.nuclear = static_cast<int>((points.array() >= 20.0).count());
  s.boom = static_cast<int>((points.array() >= 15.0).count());
  s.bust = static_cast<int>((points.array() < 10.0).count());
  return s;
}

Table summary_table(const Table &players, const Table &dst,
                    const std::vector<std::string> &names,
                    const std::vector<int> &weeks, int recent_games) {
  std::vector<std::string> out_names, out_types;
  std::vector<PointSummary> season, recent, selected;

  for (const auto &name : names) {
    const Table *source = nullptr;
    std::vector<std::size_t> rows;
    const char *type = "Player";
    if (!players.empty()) {
      rows = rows_matching(
          players.column(identity_column(players, TableKind::Players)), name);
      source = &players;
    }
    if (rows.empty() && !dst.empty()) {
      rows = rows_matching(dst.column("team"), name);
      source = &dst;
      type = "D/ST";
    }
    if (rows.empty()) {
      logger()->warn("No rows for '{}', leaving it out of the summary", name);
      continue;
    }

    const Column &fp = source->column("fantasy_points");
    const RowOrder order(*source);

    std::vector<std::size_t> latest = rows;
    order.sort_recent_first(latest);
    if (recent_games >= 0 &&
        latest.size() > static_cast<std::size_t>(recent_games))
      latest.resize(static_cast<std::size_t>(recent_games));

    std::vector<std::size_t> in_weeks;
    for (std::size_t r : rows) {
      const auto week = static_cast<int>(order.at(r).second);
      if (std::find(weeks.begin(), weeks.end(), week) != weeks.end())
        in_weeks.push_back(r);
    }

    out_names.push_back(name);
    out_types.push_back(type);
    season.push_back(summarize_points(points_of(fp, rows)));
    recent.push_back(summarize_points(points_of(fp, latest)));
    selected.push_back(summarize_points(points_of(fp, in_weeks)));
  }

  Table out;
  out.add_column(Column::string_column("name", std::move(out_names)));
  out.add_column(Column::string_column("type", std::move(out_types)));
  add_summary_columns(out, "season_", season);
  add_summary_columns(out, "recent_", recent);
  if (!weeks.empty())
    add_summary_columns(out, "weeks_", selected);
  return out;
}

} // namespace fantasy_core
