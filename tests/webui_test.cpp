#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include <httplib.h>

#include "histogram_stream_endpoints.h"
#include "jpeg_codec.h"
#include "pixscope_webui.h"
#include "snapshot_channel.h"

using namespace pixscope;

static const int kTestPort = 18573;

TEST(StreamEndpoints, RenderedJpegDecodesToRequestedSize) {
  histogram_snapshot s;
  s.r[128] = 1.0f;
  s.luma.fill(128.0f);

  stream_render_params p;
  p.w = 300;
  p.h = 64;
  p.quality = 80;
  std::vector<uint8_t> jpeg;
  std::string err;
  ASSERT_TRUE(render_snapshot_jpeg(s, p, jpeg, &err)) << err;
  ASSERT_GT(jpeg.size(), 2u);
  EXPECT_EQ(jpeg[0], 0xFF);
  EXPECT_EQ(jpeg[1], 0xD8);

  std::vector<uint32_t> px;
  uint32_t w = 0, h = 0;
  ASSERT_TRUE(jpeg_decode_xrgb(jpeg.data(), jpeg.size(), 4096, 4096, px, w, h, &err)) << err;
  EXPECT_EQ(w, 300u);
  EXPECT_EQ(h, 64u);
  EXPECT_EQ(px.size(), 300u * 64u);
}

TEST(StreamEndpoints, OddPanelSize) {
  histogram_snapshot s;
  stream_render_params p;
  p.w = 37;
  p.h = 11;
  std::vector<uint8_t> jpeg;
  std::string err;
  ASSERT_TRUE(render_snapshot_jpeg(s, p, jpeg, &err)) << err;

  std::vector<uint32_t> px;
  uint32_t w = 0, h = 0;
  ASSERT_TRUE(jpeg_decode_xrgb(jpeg.data(), jpeg.size(), 4096, 4096, px, w, h, &err)) << err;
  EXPECT_EQ(w, 37u);
  EXPECT_EQ(h, 11u);
}

namespace {

// Stops the server on every exit path so the channel below never outlives it.
struct server_stopper {
  ~server_stopper() {
    webui_stop(5000);
    webui_set_quit_flag(nullptr);
    webui_set_snapshot_channel(nullptr);
  }
};

}  // namespace

TEST(WebUi, StopDrainsOpenStreamBeforeReturning) {
  std::atomic<bool> quit{false};
  SnapshotChannel channel;
  server_stopper stopper;
  channel.publish(histogram_snapshot{});

  webui_set_snapshot_channel(&channel);
  webui_set_quit_flag(&quit);
  webui_set_listen_address("127.0.0.1");
  webui_set_render_params(64, 16, 70);
  webui_start_detached(kTestPort);

  httplib::Client cli("127.0.0.1", kTestPort);
  bool up = false;
  for (int i=0; i<200 && !up; i++) {
    auto r = cli.Get("/api/histogram");
    if (r && r->status == 200) up = true;
    else std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ASSERT_TRUE(up);

  std::atomic<size_t> streamed{0};
  std::atomic<bool> stream_done{false};
  std::thread viewer([&]() {
    httplib::Client sc("127.0.0.1", kTestPort);
    sc.set_read_timeout(10, 0);
    sc.Get("/histogram.mjpeg", [&](const char*, size_t n) {
      streamed += n;
      return true;
    });
    stream_done = true;
  });

  for (int i=0; i<500 && streamed.load() == 0; i++)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  EXPECT_GT(streamed.load(), 0u);

  // The stream handler is now parked waiting on the channel.
  EXPECT_TRUE(webui_stop(5000));
  EXPECT_TRUE(quit.load());
  viewer.join();
  EXPECT_TRUE(stream_done.load());

  // Nothing left to wait for.
  EXPECT_TRUE(webui_stop(100));
}
