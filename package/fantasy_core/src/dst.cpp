#include "fantasy_core/dst.hpp"
#include "fantasy_core/logging.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <tuple>
#include <utility>

namespace fantasy_core {

namespace {

using UnitKey = std::tuple<int, int, std::string>;

class DstAccumulator {
public:
  DstStats *unit(int season, int week, const std::string &team) {
    if (team.empty())
      return nullptr;
    return &units_[UnitKey{season, week, team}];
  }

  std::vector<StatRow> rows() const {
    std::vector<StatRow> out;
    out.reserve(units_.size());
    for (const auto &kv : units_) {
      StatRow r;
      r.key.season = std::get<0>(kv.first);
      r.key.week = std::get<1>(kv.first);
      r.key.team = std::get<2>(kv.first);
      r.key.player_id = r.key.team;
      r.key.player_name = r.key.team;
      r.key.position = "DST";
      r.stats = kv.second;
      out.push_back(std::move(r));
    }
    return out;
  }

private:
  std::map<UnitKey, DstStats> units_;
};

bool is_blocked_kick(const PlayEvent &e) {
  return e.punt_blocked || e.field_goal_result == "blocked" ||
         e.extra_point_result == "blocked";
}

bool is_scrimmage_play(const PlayEvent &e) {
  static const char *kTypes[] = {"run", "pass", "qb_kneel", "scramble"};
  const bool typed =
      std::any_of(std::begin(kTypes), std::end(kTypes),
                  [&](const char *t) { return e.play_type == t; });
  return typed || e.rush_attempt || e.pass;
}

struct GameScore {
  int season{0};
  int week{0};
  std::string home_team;
  std::string away_team;
  double home{0.0};
  double away{0.0};
};

void credit_defense(DstAccumulator &acc, const PlayEvent &e) {
  DstStats *d = acc.unit(e.season, e.week, e.defteam);
  if (d) {
    if (e.sack)
      d->sacks += 1.0;
    if (e.interception && e.defteam != e.posteam)
      d->interceptions += 1.0;
    if (e.safety)
      d->safeties += 1.0;
    if (e.fumble && (e.fumble_recovery_1_team == e.defteam ||
                     e.fumble_recovery_2_team == e.defteam))
      d->fumbles_recovered += 1.0;
    if (is_blocked_kick(e))
      d->blocked_kicks += 1.0;

    if (e.return_touchdown) {
      if (e.interception && e.td_team == e.defteam)
        d->int_td += 1.0;
      if (e.fumble && e.fumble_lost && e.td_team == e.defteam)
        d->fum_ret_td += 1.0;
      if (is_blocked_kick(e))
        d->blk_kick_td += 1.0;
    }
    if (e.defensive_two_point_conv)
      d->two_pt_returns += 1.0;
    if (e.defensive_extra_point_conv || e.extra_point_result == "safety")
      d->one_pt_safeties += 1.0;
    if (is_scrimmage_play(e) && e.yards_gained)
      d->yards_allowed += *e.yards_gained;
  }

  if (e.return_touchdown && (e.kickoff_attempt || e.punt_attempt)) {
    if (DstStats *r = acc.unit(e.season, e.week, e.return_team)) {
      if (e.kickoff_attempt)
        r->kr_td += 1.0;
      else
        r->pr_td += 1.0;
    }
  }
}

} // namespace

std::vector<StatRow> derive_dst_rows(const std::vector<PlayEvent> &events) {
  DstAccumulator acc;
  std::map<std::string, GameScore> games;
  for (const auto &e : events) {
    credit_defense(acc, e);

    if (e.game_id.empty())
      continue;
    auto it = games.find(e.game_id);
    if (it == games.end()) {
      GameScore g;
      g.season = e.season;
      g.week = e.week;
      g.home_team = e.home_team;
      g.away_team = e.away_team;
      it = games.emplace(e.game_id, g).first;
    }
    if (e.total_home_score)
      it->second.home = std::max(it->second.home, *e.total_home_score);
    if (e.total_away_score)
      it->second.away = std::max(it->second.away, *e.total_away_score);
  }

  for (const auto &kv : games) {
    const GameScore &g = kv.second;
    if (DstStats *home = acc.unit(g.season, g.week, g.home_team))
      home->points_allowed = g.away;
    if (DstStats *away = acc.unit(g.season, g.week, g.away_team))
      away->points_allowed = g.home;
  }

  std::vector<StatRow> rows = acc.rows();
  logger()->debug("Derived {} D/ST rows from {} plays across {} games",
                  rows.size(), events.size(), games.size());
  return rows;
}

Table derive_dst_table(const std::vector<PlayEvent> &events) {
  return rows_to_table(derive_dst_rows(events), PositionClass::DST);
}

} // namespace fantasy_core
