#pragma once

#include <string>
#include <utility>
#include <vector>

#include "fantasy_core/config.hpp"
#include "fantasy_core/stat_row.hpp"
#include "fantasy_core/table.hpp"

namespace fantasy_core {

// Filter text parsers. All throw FilterSpecError naming the bad token.

// Sorted distinct weeks from "N", "N-M", "N,M,K" or any mixture. Empty or
// blank text gives an empty list (no week filter). Weeks run 1-22.
std::vector<int> parse_week_spec(const std::string &spec);
std::vector<int> parse_seasons(const std::string &spec);
// Trimmed, non-empty comma-separated entries.
std::vector<std::string> parse_name_list(const std::string &spec);

// "_week_11", "_week_8-10" for consecutive weeks, "_week_8,9,11"
// otherwise, "" for no weeks.
std::string week_suffix(const std::vector<int> &weeks);
// Keeps letters, digits, '-' and '_'; spaces become '_', anything else '_'.
std::string safe_name(const std::string &name);
// "qb_stats_week_8-10.csv" and friends.
std::string stats_file_name(const std::string &stem,
                            const std::vector<int> &weeks);
// "<Name>_stats", "<TEAM>_dst_stats" or "combined_stats" plus suffix.
std::string lookup_file_name(const std::vector<std::string> &players,
                             const std::vector<std::string> &teams,
                             const std::vector<int> &weeks);

enum class ReportStage {
  Unfiltered,
  SeasonFiltered,
  WeekFiltered,
  IdentityFiltered,
  Scored,
  Sorted
};

const char *report_stage_name(ReportStage stage);

enum class ReportStatus { Ok, NoRowsMatched };

struct ReportResult {
  Table table;
  ReportStage stage{ReportStage::Unfiltered}; // last stage applied
  ReportStatus status{ReportStatus::Ok};

  bool matched() const { return status == ReportStatus::Ok; }
};

enum class TableKind { Players, Dst };

struct PositionOutput {
  PositionClass position;
  Table table;
};

// Column holding the name identity queries resolve against.
std::string identity_column(const Table &table, TableKind kind);

class ReportAssembler {
public:
  // Parses the week spec up front; a malformed spec throws here.
  explicit ReportAssembler(ReportConfig config);

  const ReportConfig &config() const { return config_; }
  const std::vector<int> &weeks() const { return weeks_; }

  // Runs the stage chain in fixed order. Season, week and identity filters
  // apply only when configured (`identities` empty means no identity
  // filter). A stage that leaves no rows stops the chain and reports
  // NoRowsMatched with that stage.
  ReportResult assemble(const Table &table, TableKind kind,
                        const std::vector<std::string> &identities = {}) const;

  // Scored, sorted player rows split into qb, rb, wr_te and k tables in
  // output column order. Empty classes are left out.
  std::vector<PositionOutput> split_positions(const Table &players) const;
  // DST table in output column order.
  Table dst_output(const Table &dst) const;

  // Players then D/ST, each sorted on its own keys, schemas aligned before
  // the union.
  ReportResult combine(const Table &players, const Table &dst) const;

private:
  ReportConfig config_;
  std::vector<int> weeks_;
};

// Sort keys for each table kind.
const std::vector<std::string> &sort_keys(TableKind kind);
// Key columns first, fantasy_points last, everything else in between in
// its current order.
Table order_output_columns(const Table &table, TableKind kind);

} // namespace fantasy_core
