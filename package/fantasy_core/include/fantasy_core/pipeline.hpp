#pragma once

#include <string>
#include <vector>

#include "fantasy_core/config.hpp"
#include "fantasy_core/identity.hpp"
#include "fantasy_core/play_event.hpp"
#include "fantasy_core/report.hpp"
#include "fantasy_core/table.hpp"

namespace fantasy_core {

struct OutputFile {
  std::string key; // "qb", "rb", "wr_te", "k", "dst"
  std::string file_name;
  Table table;
};

struct RunResult {
  // Week-filtered position tables; empty classes are left out.
  std::vector<OutputFile> files;
  // Season-filtered, scored and sorted tables over every week. Lookups and
  // summaries read these.
  Table players;
  Table dst;
};

struct LookupResult {
  Resolution players;
  Resolution teams;
  ReportResult report;
  std::string file_name;
};

struct SummaryResult {
  std::vector<std::string> names;
  Table table;
  std::string file_name;
};

// bonuses -> join -> score -> D/ST -> position outputs, with lookup and
// summary modes on top of a finished run.
class Pipeline {
public:
  explicit Pipeline(ReportConfig config);

  const ReportConfig &config() const { return config_; }
  const ReportAssembler &assembler() const { return assembler_; }

  RunResult run(const Table &player_stats,
                const std::vector<PlayEvent> &events) const;
  RunResult run(const Table &player_stats, const Table &play_by_play) const;

  // Resolves config().players and config().teams, then builds the combined
  // report of the matched identities over the selected weeks.
  LookupResult lookup(const RunResult &run) const;

  // Distribution summary of the resolved identities. Throws FilterSpecError
  // when neither players nor teams were requested.
  SummaryResult summary(const RunResult &run) const;

private:
  Resolution resolve_players(const RunResult &run) const;
  Resolution resolve_teams(const RunResult &run) const;

  ReportConfig config_;
  ReportAssembler assembler_; // selected weeks
  ReportAssembler all_weeks_; // season filter only
};

} // namespace fantasy_core
