#include "fantasy_core/bonus.hpp"
#include "fantasy_core/config.hpp"
#include "fantasy_core/dst.hpp"
#include "fantasy_core/errors.hpp"
#include "fantasy_core/identity.hpp"
#include "fantasy_core/logging.hpp"
#include "fantasy_core/pipeline.hpp"
#include "fantasy_core/reconcile.hpp"
#include "fantasy_core/report.hpp"
#include "fantasy_core/scoring.hpp"
#include "fantasy_core/summary.hpp"
#include "fantasy_core/table.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <cstdint>
#include <optional>
#include <utility>

namespace fc = fantasy_core;

namespace {

// Column builders from Python lists; None becomes a missing cell.
template <class T>
fc::Column column_from_list(const std::string &name, fc::ColumnType type,
                            const std::vector<std::optional<T>> &values) {
  std::vector<T> data(values.size());
  fc::MissingMask missing(values.size(), 0);
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (values[i])
      data[i] = *values[i];
    else
      missing[i] = 1;
  }
  fc::Column c;
  c.name = name;
  c.type = type;
  c.values = std::move(data);
  c.missing = std::move(missing);
  return c;
}

template <class T>
std::vector<std::optional<T>> column_to_list(const fc::Column &c) {
  const auto &data = std::get<std::vector<T>>(c.values);
  std::vector<std::optional<T>> out(c.size());
  for (std::size_t i = 0; i < c.size(); ++i) {
    if (!c.is_missing(i))
      out[i] = data[i];
  }
  return out;
}

} // namespace

// The NB_MODULE macro defines the entry point for the Python module.
NB_MODULE(fantasy_core_ext, m) {
  m.doc() = "League scoring, schema reconciliation and report assembly.";

  // Errors
  auto base_error =
      nanobind::exception<fc::FantasyError>(m, "FantasyError",
                                            PyExc_RuntimeError);
  nanobind::exception<fc::SchemaError>(m, "SchemaError", base_error.ptr());
  nanobind::exception<fc::UnsupportedPositionError>(
      m, "UnsupportedPositionError", base_error.ptr());
  nanobind::exception<fc::NoMatchError>(m, "NoMatchError", base_error.ptr());
  nanobind::exception<fc::FilterSpecError>(m, "FilterSpecError",
                                           base_error.ptr());

  // Logging
  m.def("set_log_level", &fc::set_log_level, nanobind::arg("level"));
  m.def("get_log_level", &fc::get_log_level);

  // Table
  nanobind::enum_<fc::ColumnType>(m, "ColumnType")
      .value("Null", fc::ColumnType::Null)
      .value("Int64", fc::ColumnType::Int64)
      .value("Float64", fc::ColumnType::Float64)
      .value("String", fc::ColumnType::String);

  nanobind::class_<fc::Table>(m, "Table")
      .def(nanobind::init<>())
      .def("row_count", &fc::Table::row_count)
      .def("column_count", &fc::Table::column_count)
      .def("column_names", &fc::Table::column_names)
      .def("has_column", &fc::Table::has_column)
      .def("schema", &fc::Table::schema)
      .def("schema_string", &fc::Table::schema_string)
      .def("column_type",
           [](const fc::Table &t, const std::string &name) {
             return t.column(name).type;
           })
      .def("add_int64_column",
           [](fc::Table &t, const std::string &name,
              const std::vector<std::optional<std::int64_t>> &v) {
             t.add_column(
                 column_from_list(name, fc::ColumnType::Int64, v));
           })
      .def("add_float64_column",
           [](fc::Table &t, const std::string &name,
              const std::vector<std::optional<double>> &v) {
             t.add_column(column_from_list(name, fc::ColumnType::Float64, v));
           })
      .def("add_string_column",
           [](fc::Table &t, const std::string &name,
              const std::vector<std::optional<std::string>> &v) {
             t.add_column(column_from_list(name, fc::ColumnType::String, v));
           })
      .def("add_null_column",
           [](fc::Table &t, const std::string &name, std::size_t n) {
             t.add_column(fc::Column::null_column(name, n));
           })
      .def("int64_values",
           [](const fc::Table &t, const std::string &name) {
             return column_to_list<std::int64_t>(
                 t.column(name).cast(fc::ColumnType::Int64));
           })
      .def("float64_values",
           [](const fc::Table &t, const std::string &name) {
             return column_to_list<double>(
                 t.column(name).cast(fc::ColumnType::Float64));
           })
      .def("string_values",
           [](const fc::Table &t, const std::string &name) {
             return column_to_list<std::string>(
                 t.column(name).cast(fc::ColumnType::String));
           })
      .def("select", &fc::Table::select)
      .def("drop", &fc::Table::drop)
      .def("sort_by", &fc::Table::sort_by, nanobind::arg("keys"),
           nanobind::arg("descending") = false)
      .def("head", &fc::Table::head)
      .def("left_join", &fc::Table::left_join)
      .def_static("concat", &fc::Table::concat)
      .def("__len__", &fc::Table::row_count)
      .def("__repr__", [](const fc::Table &t) {
        return fmt::format("Table(rows={}, columns={})", t.row_count(),
                           t.schema_string());
      });

  // Scoring
  nanobind::enum_<fc::PositionClass>(m, "PositionClass")
      .value("QB", fc::PositionClass::QB)
      .value("RB", fc::PositionClass::RB)
      .value("WR_TE", fc::PositionClass::WR_TE)
      .value("K", fc::PositionClass::K)
      .value("DST", fc::PositionClass::DST);

  m.def("position_class_from_string", &fc::position_class_from_string);
  m.def("points_allowed_component", &fc::points_allowed_component);
  m.def("yards_allowed_component", &fc::yards_allowed_component);
  m.def("score_rows", &fc::score_rows, nanobind::arg("table"),
        nanobind::arg("position"));
  m.def("score_table", &fc::score_table, nanobind::arg("table"),
        nanobind::arg("position"));
  m.def("score_player_table", &fc::score_player_table);

  // Identity
  nanobind::class_<fc::PlayerIdentity>(m, "PlayerIdentity")
      .def(nanobind::init<>())
      .def(nanobind::init<std::string, std::vector<std::string>>(),
           nanobind::arg("canonical"),
           nanobind::arg("aliases") = std::vector<std::string>{})
      .def_rw("canonical", &fc::PlayerIdentity::canonical)
      .def_rw("aliases", &fc::PlayerIdentity::aliases)
      .def("__repr__", [](const fc::PlayerIdentity &p) {
        return fmt::format("PlayerIdentity(canonical={}, aliases=[{}])",
                           p.canonical, fmt::join(p.aliases, ", "));
      });

  nanobind::class_<fc::IdentityTable>(m, "IdentityTable")
      .def(nanobind::init<>())
      .def("add", &fc::IdentityTable::add)
      .def("size", &fc::IdentityTable::size)
      .def("has", &fc::IdentityTable::has)
      .def("get", &fc::IdentityTable::get)
      .def("identities", &fc::IdentityTable::identities)
      .def_static("from_column", &fc::IdentityTable::from_column);

  nanobind::class_<fc::Match>(m, "Match")
      .def(nanobind::init<>())
      .def_rw("canonical", &fc::Match::canonical)
      .def_rw("score", &fc::Match::score)
      .def("__repr__", [](const fc::Match &mt) {
        return fmt::format("Match(canonical={}, score={:.3f})", mt.canonical,
                           mt.score);
      });

  nanobind::class_<fc::Resolution>(m, "Resolution")
      .def(nanobind::init<>())
      .def_rw("matched", &fc::Resolution::matched)
      .def_rw("unmatched", &fc::Resolution::unmatched);

  m.def("nfl_teams", &fc::nfl_teams, nanobind::rv_policy::reference);
  m.def("team_identities", &fc::team_identities);
  m.def("normalize_name", &fc::normalize_name);
  m.def("name_similarity", &fc::name_similarity);
  m.def("resolve", &fc::resolve, nanobind::arg("query"),
        nanobind::arg("candidates"),
        nanobind::arg("cutoff") = fc::kDefaultNameCutoff);
  m.def("resolve_one", &fc::resolve_one, nanobind::arg("query"),
        nanobind::arg("candidates"),
        nanobind::arg("cutoff") = fc::kDefaultNameCutoff);
  m.def("resolve_all", &fc::resolve_all, nanobind::arg("queries"),
        nanobind::arg("candidates"),
        nanobind::arg("cutoff") = fc::kDefaultNameCutoff,
        nanobind::arg("kind") = "player");

  // Play-by-play, bonuses and D/ST
  nanobind::class_<fc::PlayEvent>(m, "PlayEvent")
      .def(nanobind::init<>())
      .def_rw("season", &fc::PlayEvent::season)
      .def_rw("week", &fc::PlayEvent::week)
      .def_rw("game_id", &fc::PlayEvent::game_id)
      .def_rw("posteam", &fc::PlayEvent::posteam)
      .def_rw("defteam", &fc::PlayEvent::defteam)
      .def_rw("home_team", &fc::PlayEvent::home_team)
      .def_rw("away_team", &fc::PlayEvent::away_team)
      .def_rw("total_home_score", &fc::PlayEvent::total_home_score)
      .def_rw("total_away_score", &fc::PlayEvent::total_away_score)
      .def_rw("play_type", &fc::PlayEvent::play_type)
      .def_rw("pass_", &fc::PlayEvent::pass)
      .def_rw("rush_attempt", &fc::PlayEvent::rush_attempt)
      .def_rw("touchdown", &fc::PlayEvent::touchdown)
      .def_rw("pass_touchdown", &fc::PlayEvent::pass_touchdown)
      .def_rw("rush_touchdown", &fc::PlayEvent::rush_touchdown)
      .def_rw("yards_gained", &fc::PlayEvent::yards_gained)
      .def_rw("passer_id", &fc::PlayEvent::passer_id)
      .def_rw("rusher_id", &fc::PlayEvent::rusher_id)
      .def_rw("receiver_id", &fc::PlayEvent::receiver_id)
      .def_rw("sack", &fc::PlayEvent::sack)
      .def_rw("interception", &fc::PlayEvent::interception)
      .def_rw("safety", &fc::PlayEvent::safety)
      .def_rw("fumble", &fc::PlayEvent::fumble)
      .def_rw("fumble_lost", &fc::PlayEvent::fumble_lost)
      .def_rw("fumble_recovery_1_team",
              &fc::PlayEvent::fumble_recovery_1_team)
      .def_rw("fumble_recovery_2_team",
              &fc::PlayEvent::fumble_recovery_2_team)
      .def_rw("kickoff_attempt", &fc::PlayEvent::kickoff_attempt)
      .def_rw("punt_attempt", &fc::PlayEvent::punt_attempt)
      .def_rw("punt_blocked", &fc::PlayEvent::punt_blocked)
      .def_rw("field_goal_result", &fc::PlayEvent::field_goal_result)
      .def_rw("extra_point_result", &fc::PlayEvent::extra_point_result)
      .def_rw("return_touchdown", &fc::PlayEvent::return_touchdown)
      .def_rw("return_team", &fc::PlayEvent::return_team)
      .def_rw("td_team", &fc::PlayEvent::td_team)
      .def_rw("defensive_two_point_conv",
              &fc::PlayEvent::defensive_two_point_conv)
      .def_rw("defensive_extra_point_conv",
              &fc::PlayEvent::defensive_extra_point_conv)
      .def("__repr__", [](const fc::PlayEvent &e) {
        return fmt::format("PlayEvent(game_id={}, season={}, week={}, "
                           "posteam={}, defteam={}, play_type={})",
                           e.game_id, e.season, e.week, e.posteam, e.defteam,
                           e.play_type);
      });

  m.def("events_from_table", &fc::events_from_table);

  nanobind::class_<fc::BonusRow>(m, "BonusRow")
      .def(nanobind::init<>())
      .def_rw("season", &fc::BonusRow::season)
      .def_rw("week", &fc::BonusRow::week)
      .def_rw("player_id", &fc::BonusRow::player_id)
      .def_rw("pass_td_40p", &fc::BonusRow::pass_td_40p)
      .def_rw("pass_td_50p", &fc::BonusRow::pass_td_50p)
      .def_rw("rush_td_40p", &fc::BonusRow::rush_td_40p)
      .def_rw("rush_td_50p", &fc::BonusRow::rush_td_50p)
      .def_rw("rec_td_40p", &fc::BonusRow::rec_td_40p)
      .def_rw("rec_td_50p", &fc::BonusRow::rec_td_50p)
      .def("long_td_bonus", &fc::BonusRow::long_td_bonus)
      .def("__repr__", [](const fc::BonusRow &b) {
        return fmt::format("BonusRow(season={}, week={}, player_id={}, "
                           "long_td_bonus={})",
                           b.season, b.week, b.player_id, b.long_td_bonus());
      });

  m.def("derive_bonuses", &fc::derive_bonuses);
  m.def("bonuses_to_table", &fc::bonuses_to_table);
  m.def("derive_dst_table", &fc::derive_dst_table);

  // Reconciliation
  m.def("reconcile_and_join", &fc::reconcile_and_join, nanobind::arg("base"),
        nanobind::arg("bonuses"));
  m.def("align_schemas", &fc::align_schemas);
  m.def("concat_aligned", &fc::concat_aligned);

  // Report assembly
  m.def("parse_week_spec", &fc::parse_week_spec);
  m.def("parse_seasons", &fc::parse_seasons);
  m.def("parse_name_list", &fc::parse_name_list);
  m.def("week_suffix", &fc::week_suffix);
  m.def("safe_name", &fc::safe_name);
  m.def("stats_file_name", &fc::stats_file_name);
  m.def("lookup_file_name", &fc::lookup_file_name);

  nanobind::class_<fc::ReportConfig>(m, "ReportConfig")
      .def(nanobind::init<>())
      .def_rw("seasons", &fc::ReportConfig::seasons)
      .def_rw("output_dir", &fc::ReportConfig::output_dir)
      .def_rw("week_spec", &fc::ReportConfig::week_spec)
      .def_rw("players", &fc::ReportConfig::players)
      .def_rw("teams", &fc::ReportConfig::teams)
      .def_rw("name_score_cutoff", &fc::ReportConfig::name_score_cutoff)
      .def_rw("recent_games", &fc::ReportConfig::recent_games)
      .def_rw("log_level", &fc::ReportConfig::log_level)
      .def("__repr__", [](const fc::ReportConfig &c) {
        return fmt::format("ReportConfig(seasons=[{}], week_spec='{}', "
                           "players='{}', teams='{}', output_dir={})",
                           fmt::join(c.seasons, ", "), c.week_spec, c.players,
                           c.teams, c.output_dir);
      });

  nanobind::enum_<fc::ReportStage>(m, "ReportStage")
      .value("Unfiltered", fc::ReportStage::Unfiltered)
      .value("SeasonFiltered", fc::ReportStage::SeasonFiltered)
      .value("WeekFiltered", fc::ReportStage::WeekFiltered)
      .value("IdentityFiltered", fc::ReportStage::IdentityFiltered)
      .value("Scored", fc::ReportStage::Scored)
      .value("Sorted", fc::ReportStage::Sorted);

  nanobind::enum_<fc::ReportStatus>(m, "ReportStatus")
      .value("Ok", fc::ReportStatus::Ok)
      .value("NoRowsMatched", fc::ReportStatus::NoRowsMatched);

  nanobind::enum_<fc::TableKind>(m, "TableKind")
      .value("Players", fc::TableKind::Players)
      .value("Dst", fc::TableKind::Dst);

  nanobind::class_<fc::ReportResult>(m, "ReportResult")
      .def(nanobind::init<>())
      .def_rw("table", &fc::ReportResult::table)
      .def_rw("stage", &fc::ReportResult::stage)
      .def_rw("status", &fc::ReportResult::status)
      .def("matched", &fc::ReportResult::matched)
      .def("__repr__", [](const fc::ReportResult &r) {
        return fmt::format("ReportResult(stage={}, rows={}, matched={})",
                           fc::report_stage_name(r.stage),
                           r.table.row_count(), r.matched());
      });

  nanobind::class_<fc::PositionOutput>(m, "PositionOutput")
      .def_rw("position", &fc::PositionOutput::position)
      .def_rw("table", &fc::PositionOutput::table);

  nanobind::class_<fc::ReportAssembler>(m, "ReportAssembler")
      .def(nanobind::init<fc::ReportConfig>())
      .def("weeks", &fc::ReportAssembler::weeks)
      .def("assemble", &fc::ReportAssembler::assemble, nanobind::arg("table"),
           nanobind::arg("kind"),
           nanobind::arg("identities") = std::vector<std::string>{})
      .def("split_positions", &fc::ReportAssembler::split_positions)
      .def("dst_output", &fc::ReportAssembler::dst_output)
      .def("combine", &fc::ReportAssembler::combine);

  // Summary
  nanobind::class_<fc::PointSummary>(m, "PointSummary")
      .def(nanobind::init<>())
      .def_rw("games", &fc::PointSummary::games)
      .def_rw("mean", &fc::PointSummary::mean)
      .def_rw("median", &fc::PointSummary::median)
      .def_rw("max", &fc::PointSummary::max)
      .def_rw("min", &fc::PointSummary::min)
      .def_rw("stddev", &fc::PointSummary::stddev)
      .def_rw("mad", &fc::PointSummary::mad)
      .def_rw("nuclear", &fc::PointSummary::nuclear)
      .def_rw("boom", &fc::PointSummary::boom)
      .def_rw("bust", &fc::PointSummary::bust)
      .def("__repr__", [](const fc::PointSummary &s) {
        return fmt::format("PointSummary(games={}, mean={:.2f}, median={:.2f}, "
                           "stddev={:.2f})",
                           s.games, s.mean, s.median, s.stddev);
      });

  m.def("aggregate", &fc::aggregate, nanobind::arg("rows"),
        nanobind::arg("group_key"));
  m.def("summarize_points", &fc::summarize_points);
  m.def("summary_table", &fc::summary_table, nanobind::arg("players"),
        nanobind::arg("dst"), nanobind::arg("names"), nanobind::arg("weeks"),
        nanobind::arg("recent_games") = 4);

  // Pipeline
  nanobind::class_<fc::OutputFile>(m, "OutputFile")
      .def_rw("key", &fc::OutputFile::key)
      .def_rw("file_name", &fc::OutputFile::file_name)
      .def_rw("table", &fc::OutputFile::table);

  nanobind::class_<fc::RunResult>(m, "RunResult")
      .def_rw("files", &fc::RunResult::files)
      .def_rw("players", &fc::RunResult::players)
      .def_rw("dst", &fc::RunResult::dst);

  nanobind::class_<fc::LookupResult>(m, "LookupResult")
      .def_rw("players", &fc::LookupResult::players)
      .def_rw("teams", &fc::LookupResult::teams)
      .def_rw("report", &fc::LookupResult::report)
      .def_rw("file_name", &fc::LookupResult::file_name);

  nanobind::class_<fc::SummaryResult>(m, "SummaryResult")
      .def_rw("names", &fc::SummaryResult::names)
      .def_rw("table", &fc::SummaryResult::table)
      .def_rw("file_name", &fc::SummaryResult::file_name);

  nanobind::class_<fc::Pipeline>(m, "Pipeline")
      .def(nanobind::init<fc::ReportConfig>())
      .def("config", &fc::Pipeline::config)
      .def("run",
           nanobind::overload_cast<const fc::Table &, const fc::Table &>(
               &fc::Pipeline::run, nanobind::const_),
           nanobind::arg("player_stats"), nanobind::arg("play_by_play"))
      .def("run_events",
           nanobind::overload_cast<const fc::Table &,
                                   const std::vector<fc::PlayEvent> &>(
               &fc::Pipeline::run, nanobind::const_),
           nanobind::arg("player_stats"), nanobind::arg("events"))
      .def("lookup", &fc::Pipeline::lookup)
      .def("summary", &fc::Pipeline::summary);
}
