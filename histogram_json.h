#pragma once
#include <nlohmann/json.hpp>

#include "analysis_loop.h"
#include "histogram.h"

namespace pixscope {

// {"seq":N,"synthetic":bool,"r":[256],"g":[256],"b":[256],"luma":[50]}
nlohmann::json snapshot_to_json(const histogram_snapshot &s);

nlohmann::json loop_stats_to_json(const loop_stats &st);

}  // namespace pixscope
