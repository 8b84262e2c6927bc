#pragma once
#include <stdint.h>
#include <string>
#include <nlohmann/json.hpp>

struct scope_config {
  // Analysis raster (the frame buffer resolution).
  uint32_t capture_w=160;
  uint32_t capture_h=90;

  // Rendered histogram panel for /histogram.jpg and the MJPEG stream.
  uint32_t render_w=300;
  uint32_t render_h=64;
  int jpeg_quality=85;

  // Tick pacing.
  int refresh_hz=60;
  bool vblank=true;
  std::string drm_card;          // empty => try /dev/dri/card1, card0

  // Pushed frames older than this are treated as "not playing". 0 = never stale.
  uint32_t frame_stale_ms=500;
  std::string still_image;       // optional JPEG pinned as the frame at startup

  // 0 => seed the jitter from std::random_device.
  uint32_t noise_seed=0;

  bool start_active=true;

  std::string listen_addr="0.0.0.0";
  int webui_port=8090;
};

// Clamps sizes and rates into their supported ranges in-place.
void cfg_normalize(scope_config &c);

// "WxH" -> w,h (both non-zero). A bare "N" means NxN.
bool parse_dim(const char *s, uint32_t *out_w, uint32_t *out_h);

// JSON serialization / parsing
std::string config_to_json(const scope_config &c_in);
nlohmann::json config_to_json_obj(const scope_config &c_in);
bool config_from_json_text(const std::string &text, scope_config &c);
