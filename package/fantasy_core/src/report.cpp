#include "fantasy_core/report.hpp"
#include "fantasy_core/errors.hpp"
#include "fantasy_core/logging.hpp"
#include "fantasy_core/reconcile.hpp"
#include "fantasy_core/scoring.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <set>
#include <unordered_set>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fantasy_core {

namespace {

// Regular season plus playoffs.
constexpr int kMaxWeek = 22;

std::string trim(const std::string &s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = s.find(sep, start);
    out.push_back(s.substr(start, pos - start));
    if (pos == std::string::npos)
      break;
    start = pos + 1;
  }
  return out;
}

bool parse_int(const std::string &text, int &out) {
  const std::string t = trim(text);
  if (t.empty())
    return false;
  const char *first = t.data();
  const char *last = t.data() + t.size();
  auto res = std::from_chars(first, last, out);
  return res.ec == std::errc() && res.ptr == last;
}

MissingMask mask_in(const Column &c, const std::vector<int> &values) {
  const std::set<int> wanted(values.begin(), values.end());
  MissingMask keep(c.size(), 0);
  for (std::size_t i = 0; i < c.size(); ++i) {
    if (!c.is_missing(i) && wanted.count(static_cast<int>(c.int_at(i))))
      keep[i] = 1;
  }
  return keep;
}

MissingMask mask_in(const Column &c, const std::vector<std::string> &values) {
  const std::unordered_set<std::string> wanted(values.begin(), values.end());
  MissingMask keep(c.size(), 0);
  for (std::size_t i = 0; i < c.size(); ++i) {
    if (!c.is_missing(i) && wanted.count(c.text_at(i)))
      keep[i] = 1;
  }
  return keep;
}

} // namespace

std::vector<int> parse_week_spec(const std::string &spec) {
  std::set<int> weeks;
  for (const auto &raw : split(spec, ',')) {
    const std::string part = trim(raw);
    if (part.empty())
      continue;
    const std::size_t dash = part.find('-');
    if (dash == std::string::npos) {
      int week = 0;
      if (!parse_int(part, week) || week < 1 || week > kMaxWeek)
        throw FilterSpecError("Invalid week number", part);
      weeks.insert(week);
      continue;
    }
    int first = 0, last = 0;
    if (!parse_int(part.substr(0, dash), first) ||
        !parse_int(part.substr(dash + 1), last) || first < 1 || last < first ||
        last > kMaxWeek)
      throw FilterSpecError("Invalid week range", part);
    for (int w = first; w <= last; ++w)
      weeks.insert(w);
  }
  return std::vector<int>(weeks.begin(), weeks.end());
}

std::vector<int> parse_seasons(const std::string &spec) {
  std::vector<int> seasons;
  for (const auto &raw : split(spec, ',')) {
    const std::string part = trim(raw);
    if (part.empty())
      continue;
    int season = 0;
    if (!parse_int(part, season))
      throw FilterSpecError("Invalid season", part);
    if (std::find(seasons.begin(), seasons.end(), season) == seasons.end())
      seasons.push_back(season);
  }
  return seasons;
}

std::vector<std::string> parse_name_list(const std::string &spec) {
  std::vector<std::string> names;
  for (const auto &raw : split(spec, ',')) {
    std::string name = trim(raw);
    if (!name.empty())
      names.push_back(std::move(name));
  }
  return names;
}

std::string week_suffix(const std::vector<int> &weeks) {
  if (weeks.empty())
    return {};
  if (weeks.size() == 1)
    return fmt::format("_week_{}", weeks.front());
  bool consecutive = true;
  for (std::size_t i = 1; i < weeks.size(); ++i) {
    if (weeks[i] != weeks[i - 1] + 1) {
      consecutive = false;
      break;
    }
  }
  if (consecutive)
    return fmt::format("_week_{}-{}", weeks.front(), weeks.back());
  return fmt::format("_week_{}", fmt::join(weeks, ","));
}

std::string safe_name(const std::string &name) {
  std::string out;
  out.reserve(name.size());
  for (unsigned char c : name) {
    if (std::isalnum(c) || c == '-' || c == '_')
      out.push_back(static_cast<char>(c));
    else
      out.push_back('_');
  }
  return out;
}

std::string stats_file_name(const std::string &stem,
                            const std::vector<int> &weeks) {
  return fmt::format("{}{}.csv", stem, week_suffix(weeks));
}

std::string lookup_file_name(const std::vector<std::string> &players,
                             const std::vector<std::string> &teams,
                             const std::vector<int> &weeks) {
  std::string stem = "combined_stats";
  if (players.size() + teams.size() == 1) {
    stem = players.empty() ? safe_name(teams.front()) + "_dst_stats"
                           : safe_name(players.front()) + "_stats";
  }
  return stats_file_name(stem, weeks);
}

const char *report_stage_name(ReportStage stage) {
  switch (stage) {
  case ReportStage::Unfiltered:
    return "unfiltered";
  case ReportStage::SeasonFiltered:
    return "season-filtered";
  case ReportStage::WeekFiltered:
    return "week-filtered";
  case ReportStage::IdentityFiltered:
    return "identity-filtered";
  case ReportStage::Scored:
    return "scored";
  case ReportStage::Sorted:
    return "sorted";
  }
  return "unfiltered";
}

std::string identity_column(const Table &table, TableKind kind) {
  if (kind == TableKind::Dst)
    return "team";
  return table.has_column("player_display_name") ? "player_display_name"
                                                 : "player_name";
}

const std::vector<std::string> &sort_keys(TableKind kind) {
  static const std::vector<std::string> players = {"season", "week",
                                                   "player_id"};
  static const std::vector<std::string> dst = {"season", "week", "team"};
  return kind == TableKind::Dst ? dst : players;
}

Table order_output_columns(const Table &table, TableKind kind) {
  static const std::vector<std::string> player_base = {
      "season", "week", "player_id", "player_name", "team", "position"};
  static const std::vector<std::string> dst_base = {"season", "week", "team"};
  const auto &base = kind == TableKind::Dst ? dst_base : player_base;

  std::vector<std::string> order;
  for (const auto &name : base) {
    if (table.has_column(name))
      order.push_back(name);
  }
  for (const auto &c : table.columns()) {
    if (c.name != "fantasy_points" &&
        std::find(base.begin(), base.end(), c.name) == base.end())
      order.push_back(c.name);
  }
  if (table.has_column("fantasy_points"))
    order.push_back("fantasy_points");
  return table.select(order);
}

ReportAssembler::ReportAssembler(ReportConfig config)
    : config_(std::move(config)), weeks_(parse_week_spec(config_.week_spec)) {}

ReportResult
ReportAssembler::assemble(const Table &table, TableKind kind,
                          const std::vector<std::string> &identities) const {
  const char *label = kind == TableKind::Dst ? "D/ST" : "player";
  ReportResult r;
  r.table = table;

  auto emptied = [&](ReportStage stage) {
    r.stage = stage;
    logger()->debug("{} table {}: {} rows", label, report_stage_name(stage),
                    r.table.row_count());
    if (!r.table.empty())
      return false;
    r.status = ReportStatus::NoRowsMatched;
    logger()->warn("No {} rows matched at the {} stage", label,
                   report_stage_name(stage));
    return true;
  };

  if (emptied(ReportStage::Unfiltered))
    return r;

  if (!config_.seasons.empty()) {
    r.table =
        r.table.filter(mask_in(r.table.column("season"), config_.seasons));
    if (emptied(ReportStage::SeasonFiltered))
      return r;
  }
  if (!weeks_.empty()) {
    r.table = r.table.filter(mask_in(r.table.column("week"), weeks_));
    if (emptied(ReportStage::WeekFiltered))
      return r;
  }
  if (!identities.empty()) {
    const std::string col = identity_column(r.table, kind);
    r.table = r.table.filter(mask_in(r.table.column(col), identities));
    if (emptied(ReportStage::IdentityFiltered))
      return r;
  }

  if (kind == TableKind::Dst) {
    r.table = score_table(r.table, PositionClass::DST);
  } else {
    // Positions without a formula (FB, OL, ...) never reach a report.
    const Column &position = r.table.column("position");
    MissingMask keep(position.size(), 0);
    for (std::size_t i = 0; i < position.size(); ++i) {
      const std::string p = position.text_at(i);
      keep[i] = is_supported_position(p) &&
                position_class_from_string(p) != PositionClass::DST;
    }
    const std::size_t before = r.table.row_count();
    r.table = r.table.filter(keep);
    if (r.table.row_count() != before) {
      logger()->debug("Dropped {} rows with unscored positions",
                      before - r.table.row_count());
    }
    r.table = score_player_table(r.table);
  }
  if (emptied(ReportStage::Scored))
    return r;

  r.table = r.table.sort_by(sort_keys(kind));
  emptied(ReportStage::Sorted);
  return r;
}

std::vector<PositionOutput>
ReportAssembler::split_positions(const Table &players) const {
  std::vector<PositionOutput> out;
  if (players.empty())
    return out;
  const Column &position = players.column("position");
  for (PositionClass pc : {PositionClass::QB, PositionClass::RB,
                           PositionClass::WR_TE, PositionClass::K}) {
    MissingMask keep(position.size(), 0);
    for (std::size_t i = 0; i < position.size(); ++i) {
      const std::string p = position.text_at(i);
      keep[i] = is_supported_position(p) && position_class_from_string(p) == pc;
    }
    Table part = players.filter(keep);
    if (part.empty())
      continue;
    out.push_back(
        {pc, order_output_columns(part.sort_by(sort_keys(TableKind::Players)),
                                  TableKind::Players)});
  }
  return out;
}

Table ReportAssembler::dst_output(const Table &dst) const {
  if (dst.empty())
    return dst;
  return order_output_columns(dst.sort_by(sort_keys(TableKind::Dst)),
                              TableKind::Dst);
}

ReportResult ReportAssembler::combine(const Table &players,
                                      const Table &dst) const {
  ReportResult r;
  r.stage = ReportStage::Sorted;
  if (players.empty() && dst.empty()) {
    r.status = ReportStatus::NoRowsMatched;
    logger()->warn("No rows matched for the combined report");
    return r;
  }
  if (dst.empty()) {
    r.table = order_output_columns(
        players.sort_by(sort_keys(TableKind::Players)), TableKind::Players);
    return r;
  }
  if (players.empty()) {
    r.table = dst_output(dst);
    return r;
  }
  const Table p = players.sort_by(sort_keys(TableKind::Players));
  const Table d = dst.sort_by(sort_keys(TableKind::Dst));
  r.table = order_output_columns(concat_aligned({p, d}), TableKind::Players);
  logger()->debug("Combined {} player rows and {} D/ST rows", p.row_count(),
                  d.row_count());
  return r;
}

} // namespace fantasy_core
