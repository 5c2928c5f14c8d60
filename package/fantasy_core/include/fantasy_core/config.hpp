#pragma once

#include <string>
#include <vector>

#include "fantasy_core/identity.hpp"

namespace fantasy_core {

struct ReportConfig {
  std::vector<int> seasons{2025};
  std::string output_dir{"output"};
  // "11", "8-10", "8,9,11-13"; empty means every week.
  std::string week_spec;
  // Comma-separated player and team queries; empty means no lookup.
  std::string players;
  std::string teams;
  double name_score_cutoff{kDefaultNameCutoff};
  int recent_games{4};
  std::string log_level{"info"};
};

} // namespace fantasy_core
