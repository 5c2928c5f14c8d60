#include "fantasy_core/pipeline.hpp"
#include "fantasy_core/bonus.hpp"
#include "fantasy_core/dst.hpp"
#include "fantasy_core/errors.hpp"
#include "fantasy_core/logging.hpp"
#include "fantasy_core/reconcile.hpp"
#include "fantasy_core/summary.hpp"

#include <utility>

#include <fmt/ranges.h>

namespace fantasy_core {

namespace {

ReportConfig without_weeks(ReportConfig config) {
  config.week_spec.clear();
  return config;
}

} // namespace

Pipeline::Pipeline(ReportConfig config)
    : config_(std::move(config)), assembler_(config_),
      all_weeks_(without_weeks(config_)) {
  set_log_level(config_.log_level);
}

RunResult Pipeline::run(const Table &player_stats,
                        const std::vector<PlayEvent> &events) const {
  logger()->info("Processing seasons: {}", fmt::join(config_.seasons, ","));
  if (!assembler_.weeks().empty())
    logger()->info("Filtering to weeks: {}",
                   fmt::join(assembler_.weeks(), ","));

  logger()->info("Calculating long TD bonuses from {} plays", events.size());
  const Table bonuses = bonuses_to_table(derive_bonuses(events));

  logger()->info("Joining stats with long TD bonuses");
  const Table joined = reconcile_and_join(player_stats, bonuses);

  logger()->info("Processing D/ST statistics");
  const Table dst_base = derive_dst_table(events);

  RunResult result;
  result.players = all_weeks_.assemble(joined, TableKind::Players).table;
  result.dst = all_weeks_.assemble(dst_base, TableKind::Dst).table;

  const std::vector<int> &weeks = assembler_.weeks();
  const ReportResult players = assembler_.assemble(joined, TableKind::Players);
  if (players.matched()) {
    for (auto &part : assembler_.split_positions(players.table)) {
      const std::string key = position_class_key(part.position);
      result.files.push_back(
          {key, stats_file_name(key + "_stats", weeks), std::move(part.table)});
    }
  }
  const ReportResult dst = assembler_.assemble(dst_base, TableKind::Dst);
  if (dst.matched()) {
    result.files.push_back({position_class_key(PositionClass::DST),
                            stats_file_name("dst_stats", weeks),
                            assembler_.dst_output(dst.table)});
  }
  logger()->info("Generated {} output tables", result.files.size());
  return result;
}

RunResult Pipeline::run(const Table &player_stats,
                        const Table &play_by_play) const {
  return run(player_stats, events_from_table(play_by_play));
}

Resolution Pipeline::resolve_players(const RunResult &run) const {
  const std::vector<std::string> queries = parse_name_list(config_.players);
  if (queries.empty())
    return {};
  const IdentityTable candidates = IdentityTable::from_column(
      run.players, identity_column(run.players, TableKind::Players));
  return resolve_all(queries, candidates, config_.name_score_cutoff,
                     "player");
}

Resolution Pipeline::resolve_teams(const RunResult &run) const {
  const std::vector<std::string> queries = parse_name_list(config_.teams);
  if (queries.empty())
    return {};
  return resolve_all(queries, team_identities(run.dst),
                     config_.name_score_cutoff, "team");
}

LookupResult Pipeline::lookup(const RunResult &run) const {
  LookupResult out;
  out.players = resolve_players(run);
  out.teams = resolve_teams(run);

  Table players, dst;
  if (!out.players.matched.empty()) {
    ReportResult r = assembler_.assemble(run.players, TableKind::Players,
                                         out.players.matched);
    if (r.matched())
      players = std::move(r.table);
  }
  if (!out.teams.matched.empty()) {
    ReportResult r =
        assembler_.assemble(run.dst, TableKind::Dst, out.teams.matched);
    if (r.matched())
      dst = std::move(r.table);
  }
  out.report = assembler_.combine(players, dst);
  out.file_name = lookup_file_name(out.players.matched, out.teams.matched,
                                   assembler_.weeks());
  return out;
}

SummaryResult Pipeline::summary(const RunResult &run) const {
  if (parse_name_list(config_.players).empty() &&
      parse_name_list(config_.teams).empty()) {
    throw FilterSpecError("Summary needs at least one player or team",
                          config_.players + config_.teams);
  }
  SummaryResult out;
  const Resolution players = resolve_players(run);
  const Resolution teams = resolve_teams(run);
  out.names = players.matched;
  out.names.insert(out.names.end(), teams.matched.begin(),
                   teams.matched.end());
  if (out.names.empty())
    logger()->warn("No valid players or teams found for the summary");

  out.table = summary_table(run.players, run.dst, out.names,
                            assembler_.weeks(), config_.recent_games);
  out.file_name = stats_file_name("summary_stats", assembler_.weeks());
  return out;
}

} // namespace fantasy_core
