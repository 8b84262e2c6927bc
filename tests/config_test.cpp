#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "scope_config.h"

using nlohmann::json;

TEST(ScopeConfig, DefaultsSerialize) {
  scope_config c;
  json j = config_to_json_obj(c);
  EXPECT_EQ(j["captureSize"], "160x90");
  EXPECT_EQ(j["renderSize"], "300x64");
  EXPECT_EQ(j["refreshHz"], 60);
  EXPECT_EQ(j["vblank"], true);
  EXPECT_EQ(j["frameStaleMs"], 500);
  EXPECT_EQ(j["noiseSeed"], 0);
  EXPECT_EQ(j["startActive"], true);
  EXPECT_EQ(j["listenAddr"], "0.0.0.0");
  EXPECT_EQ(j["webuiPort"], 8090);
}

TEST(ScopeConfig, ParsesKnownKeys) {
  scope_config c;
  ASSERT_TRUE(config_from_json_text(R"({
    "captureSize": "320x180",
    "refreshHz": 30,
    "vblank": false,
    "drmCard": "/dev/dri/card0",
    "frameStaleMs": 0,
    "noiseSeed": 42,
    "startActive": false,
    "stillImage": "test.jpg",
    "webuiPort": 9000
  })", c));
  EXPECT_EQ(c.capture_w, 320u);
  EXPECT_EQ(c.capture_h, 180u);
  EXPECT_EQ(c.refresh_hz, 30);
  EXPECT_FALSE(c.vblank);
  EXPECT_EQ(c.drm_card, "/dev/dri/card0");
  EXPECT_EQ(c.frame_stale_ms, 0u);
  EXPECT_EQ(c.noise_seed, 42u);
  EXPECT_FALSE(c.start_active);
  EXPECT_EQ(c.still_image, "test.jpg");
  EXPECT_EQ(c.webui_port, 9000);
}

TEST(ScopeConfig, WrongTypesKeepDefaults) {
  scope_config c;
  ASSERT_TRUE(config_from_json_text(R"({"refreshHz":"fast","vblank":1,"captureSize":"0x5"})", c));
  EXPECT_EQ(c.refresh_hz, 60);
  EXPECT_TRUE(c.vblank);
  EXPECT_EQ(c.capture_w, 160u);
  EXPECT_EQ(c.capture_h, 90u);
}

TEST(ScopeConfig, RejectsMalformedText) {
  scope_config c;
  EXPECT_FALSE(config_from_json_text("{not json", c));
  EXPECT_FALSE(config_from_json_text("[1,2,3]", c));
}

TEST(ScopeConfig, NormalizeClamps) {
  scope_config c;
  c.capture_w = 5000;
  c.capture_h = 0;
  c.refresh_hz = 1000;
  c.jpeg_quality = 0;
  c.webui_port = 70000;
  c.listen_addr.clear();
  cfg_normalize(c);
  EXPECT_EQ(c.capture_w, 1920u);
  EXPECT_EQ(c.capture_h, 90u);
  EXPECT_EQ(c.refresh_hz, 240);
  EXPECT_EQ(c.jpeg_quality, 1);
  EXPECT_EQ(c.webui_port, 8090);
  EXPECT_EQ(c.listen_addr, "0.0.0.0");
}

TEST(ScopeConfig, RoundTripsThroughText) {
  scope_config a;
  a.capture_w = 64; a.capture_h = 36;
  a.noise_seed = 7;
  a.vblank = false;
  scope_config b;
  ASSERT_TRUE(config_from_json_text(config_to_json(a), b));
  EXPECT_EQ(config_to_json(a), config_to_json(b));
}

TEST(ScopeConfig, ParseDim) {
  uint32_t w=0, h=0;
  EXPECT_TRUE(parse_dim("160x90", &w, &h));
  EXPECT_EQ(w, 160u); EXPECT_EQ(h, 90u);
  EXPECT_TRUE(parse_dim("64", &w, &h));
  EXPECT_EQ(w, 64u); EXPECT_EQ(h, 64u);
  EXPECT_FALSE(parse_dim("x90", &w, &h));
  EXPECT_FALSE(parse_dim("160x", &w, &h));
  EXPECT_FALSE(parse_dim("axb", &w, &h));
  EXPECT_FALSE(parse_dim("", &w, &h));
}
