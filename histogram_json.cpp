#include "histogram_json.h"

using nlohmann::json;

namespace pixscope {

template <size_t N>
static json float_array(const std::array<float, N> &v) {
  json a = json::array();
  for (float f : v) a.push_back(f);
  return a;
}

json snapshot_to_json(const histogram_snapshot &s) {
  json j;
  j["seq"] = s.seq;
  j["synthetic"] = s.synthetic;
  j["r"] = float_array(s.r);
  j["g"] = float_array(s.g);
  j["b"] = float_array(s.b);
  j["luma"] = float_array(s.luma);
  return j;
}

json loop_stats_to_json(const loop_stats &st) {
  json j;
  j["active"] = st.active;
  j["ticks"] = st.ticks;
  j["realTicks"] = st.real_ticks;
  j["syntheticTicks"] = st.synthetic_ticks;
  j["unavailable"] = st.unavailable;
  j["readFailures"] = st.read_failures;
  j["lastCapture"] = capture_status_to_string(st.last_capture);
  j["syntheticOffset"] = st.synthetic_offset;
  if (!st.last_error.empty()) j["lastError"] = st.last_error;
  return j;
}

}  // namespace pixscope
