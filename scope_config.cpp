#include "scope_config.h"
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <algorithm>

#include "frame_buffer.h"

using nlohmann::json;

static bool parse_u32(const char *s, uint32_t *out) {
  if (!s || !*s) return false;
  char *end = NULL;
  errno = 0;
  unsigned long v = strtoul(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0') return false;
  if (v > 0xFFFFFFFFul) return false;
  *out = (uint32_t)v;
  return true;
}

bool parse_dim(const char *s, uint32_t *out_w, uint32_t *out_h) {
  const char *x = (s ? strchr(s, 'x') : NULL);
  if (!s || !*s) return false;
  if (!x) {
    uint32_t d = 0;
    if (!parse_u32(s, &d) || d == 0) return false;
    *out_w = d; *out_h = d;
    return true;
  }
  char a[64], b[64];
  size_t la = (size_t)(x - s);
  size_t lb = strlen(x + 1);
  if (la == 0 || lb == 0 || la >= sizeof(a) || lb >= sizeof(b)) return false;
  memcpy(a, s, la); a[la] = 0;
  memcpy(b, x + 1, lb); b[lb] = 0;
  uint32_t w = 0, h = 0;
  if (!parse_u32(a, &w) || !parse_u32(b, &h)) return false;
  if (w == 0 || h == 0) return false;
  *out_w = w; *out_h = h;
  return true;
}

static std::string dim_string(uint32_t w, uint32_t h) {
  return std::to_string(w) + "x" + std::to_string(h);
}

void cfg_normalize(scope_config &c) {
  if (c.capture_w == 0) c.capture_w = pixscope::kDefaultCaptureW;
  if (c.capture_h == 0) c.capture_h = pixscope::kDefaultCaptureH;
  c.capture_w = std::min(c.capture_w, pixscope::kMaxCaptureW);
  c.capture_h = std::min(c.capture_h, pixscope::kMaxCaptureH);

  if (c.render_w == 0) c.render_w = 300;
  if (c.render_h == 0) c.render_h = 64;
  c.render_w = std::min<uint32_t>(c.render_w, 1920);
  c.render_h = std::min<uint32_t>(c.render_h, 1080);

  c.jpeg_quality = std::clamp(c.jpeg_quality, 1, 100);
  c.refresh_hz = std::clamp(c.refresh_hz, 1, 240);
  c.frame_stale_ms = std::min<uint32_t>(c.frame_stale_ms, 60000);

  if (c.listen_addr.empty()) c.listen_addr = "0.0.0.0";
  if (c.webui_port <= 0 || c.webui_port > 65535) c.webui_port = 8090;
}

json config_to_json_obj(const scope_config &c_in) {
  scope_config c = c_in;
  cfg_normalize(c);

  json j;
  j["captureSize"] = dim_string(c.capture_w, c.capture_h);
  j["renderSize"] = dim_string(c.render_w, c.render_h);
  j["jpegQuality"] = c.jpeg_quality;
  j["refreshHz"] = c.refresh_hz;
  j["vblank"] = c.vblank;
  j["drmCard"] = c.drm_card;
  j["frameStaleMs"] = c.frame_stale_ms;
  j["stillImage"] = c.still_image;
  j["noiseSeed"] = c.noise_seed;
  j["startActive"] = c.start_active;
  j["listenAddr"] = c.listen_addr;
  j["webuiPort"] = c.webui_port;
  return j;
}

std::string config_to_json(const scope_config &c_in) {
  return config_to_json_obj(c_in).dump(2);
}

bool config_from_json_text(const std::string &text, scope_config &c) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return false;

  auto get_str = [&](const char *k, std::string &out) {
    if (j.contains(k) && j[k].is_string()) out = j[k].get<std::string>();
  };
  auto get_bool = [&](const char *k, bool &out) {
    if (j.contains(k) && j[k].is_boolean()) out = j[k].get<bool>();
  };
  auto get_int = [&](const char *k, int &out) {
    if (j.contains(k) && j[k].is_number_integer()) out = j[k].get<int>();
  };
  auto get_u32 = [&](const char *k, uint32_t &out) {
    if (j.contains(k) && j[k].is_number_integer()) {
      long long v = j[k].get<long long>();
      if (v >= 0 && v <= 0xFFFFFFFFll) out = (uint32_t)v;
    }
  };

  std::string capture;
  get_str("captureSize", capture);
  if (!capture.empty()) {
    uint32_t w=0,h=0;
    if (parse_dim(capture.c_str(), &w,&h)) { c.capture_w=w; c.capture_h=h; }
  }

  std::string render;
  get_str("renderSize", render);
  if (!render.empty()) {
    uint32_t w=0,h=0;
    if (parse_dim(render.c_str(), &w,&h)) { c.render_w=w; c.render_h=h; }
  }

  get_int("jpegQuality", c.jpeg_quality);
  get_int("refreshHz", c.refresh_hz);
  get_bool("vblank", c.vblank);
  get_str("drmCard", c.drm_card);
  get_u32("frameStaleMs", c.frame_stale_ms);
  get_str("stillImage", c.still_image);
  get_u32("noiseSeed", c.noise_seed);
  get_bool("startActive", c.start_active);
  get_str("listenAddr", c.listen_addr);
  get_int("webuiPort", c.webui_port);

  cfg_normalize(c);
  return true;
}
