#include "fantasy_core/play_event.hpp"

#include <utility>

namespace fantasy_core {

namespace {

class RowReader {
public:
  explicit RowReader(const Table &t) : table_(t) {}

  const Column *col(const char *name) const {
    const int idx = table_.find_column(name);
    return idx < 0 ? nullptr
                   : &table_.columns()[static_cast<std::size_t>(idx)];
  }

  static bool flag(const Column *c, std::size_t i) {
    if (!c || c->is_missing(i) || c->type == ColumnType::String)
      return false;
    return c->number_at(i) != 0.0;
  }

  static std::string text(const Column *c, std::size_t i) {
    return c ? c->text_at(i) : std::string();
  }

  static std::optional<double> number(const Column *c, std::size_t i) {
    if (!c || c->is_missing(i) || c->type == ColumnType::String ||
        c->type == ColumnType::Null)
      return std::nullopt;
    return c->number_at(i);
  }

  static std::optional<std::string> id(const Column *c, std::size_t i) {
    if (!c || c->is_missing(i))
      return std::nullopt;
    std::string s = c->text_at(i);
    if (s.empty())
      return std::nullopt;
    return s;
  }

private:
  const Table &table_;
};

} // namespace

std::vector<PlayEvent> events_from_table(const Table &pbp) {
  RowReader r(pbp);
  const Column *season = r.col("season");
  const Column *week = r.col("week");
  const Column *game_id = r.col("game_id");
  const Column *posteam = r.col("posteam");
  const Column *defteam = r.col("defteam");
  const Column *home_team = r.col("home_team");
  const Column *away_team = r.col("away_team");
  const Column *home_score = r.col("total_home_score");
  const Column *away_score = r.col("total_away_score");
  const Column *play_type = r.col("play_type");
  const Column *pass = r.col("pass");
  const Column *rush_attempt = r.col("rush_attempt");
  const Column *rush = r.col("rush");
  const Column *touchdown = r.col("touchdown");
  const Column *pass_touchdown = r.col("pass_touchdown");
  const Column *rush_touchdown = r.col("rush_touchdown");
  const Column *yards_gained = r.col("yards_gained");
  const Column *passer_id = r.col("passer_id");
  const Column *rusher_id = r.col("rusher_id");
  const Column *receiver_id = r.col("receiver_id");
  const Column *sack = r.col("sack");
  const Column *interception = r.col("interception");
  const Column *safety = r.col("safety");
  const Column *fumble = r.col("fumble");
  const Column *fumble_lost = r.col("fumble_lost");
  const Column *rec1 = r.col("fumble_recovery_1_team");
  const Column *rec2 = r.col("fumble_recovery_2_team");
  const Column *kickoff = r.col("kickoff_attempt");
  const Column *punt = r.col("punt_attempt");
  const Column *punt_blocked = r.col("punt_blocked");
  const Column *fg_result = r.col("field_goal_result");
  const Column *xp_result = r.col("extra_point_result");
  const Column *return_td = r.col("return_touchdown");
  const Column *return_team = r.col("return_team");
  const Column *td_team = r.col("td_team");
  const Column *def_2pt = r.col("defensive_two_point_conv");
  const Column *def_xp = r.col("defensive_extra_point_conv");

  std::vector<PlayEvent> events;
  events.reserve(pbp.row_count());
  for (std::size_t i = 0; i < pbp.row_count(); ++i) {
    PlayEvent e;
    e.season = season ? static_cast<int>(season->int_at(i)) : 0;
    e.week = week ? static_cast<int>(week->int_at(i)) : 0;
    e.game_id = RowReader::text(game_id, i);
    e.posteam = RowReader::text(posteam, i);
    e.defteam = RowReader::text(defteam, i);
    e.home_team = RowReader::text(home_team, i);
    e.away_team = RowReader::text(away_team, i);
    e.total_home_score = RowReader::number(home_score, i);
    e.total_away_score = RowReader::number(away_score, i);
    e.play_type = RowReader::text(play_type, i);
    e.pass = RowReader::flag(pass, i);
    e.rush_attempt =
        RowReader::flag(rush_attempt, i) || RowReader::flag(rush, i);
    e.touchdown = RowReader::flag(touchdown, i);
    e.pass_touchdown = RowReader::flag(pass_touchdown, i);
    // Older extracts carry only the generic touchdown flag.
    e.rush_touchdown = rush_touchdown ? RowReader::flag(rush_touchdown, i)
                                      : e.rush_attempt && e.touchdown;
    e.yards_gained = RowReader::number(yards_gained, i);
    e.passer_id = RowReader::id(passer_id, i);
    e.rusher_id = RowReader::id(rusher_id, i);
    e.receiver_id = RowReader::id(receiver_id, i);
    e.sack = RowReader::flag(sack, i);
    e.interception = RowReader::flag(interception, i);
    e.safety = RowReader::flag(safety, i);
    e.fumble = RowReader::flag(fumble, i);
    e.fumble_lost = RowReader::flag(fumble_lost, i);
    e.fumble_recovery_1_team = RowReader::text(rec1, i);
    e.fumble_recovery_2_team = RowReader::text(rec2, i);
    e.kickoff_attempt = RowReader::flag(kickoff, i);
    e.punt_attempt = RowReader::flag(punt, i);
    e.punt_blocked = RowReader::flag(punt_blocked, i);
    e.field_goal_result = RowReader::text(fg_result, i);
    e.extra_point_result = RowReader::text(xp_result, i);
    e.return_touchdown = RowReader::flag(return_td, i);
    e.return_team = RowReader::text(return_team, i);
    e.td_team = RowReader::text(td_team, i);
    e.defensive_two_point_conv = RowReader::flag(def_2pt, i);
    e.defensive_extra_point_conv = RowReader::flag(def_xp, i);
    events.push_back(std::move(e));
  }
  return events;
}

} // namespace fantasy_core
