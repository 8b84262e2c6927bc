#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include <httplib.h>

#include "histogram.h"

namespace pixscope { class SnapshotChannel; }

struct stream_render_params {
  uint32_t w = 300;
  uint32_t h = 64;
  int quality = 85;
};

// Renders one snapshot into a w x h panel and JPEG-encodes it.
bool render_snapshot_jpeg(const pixscope::histogram_snapshot &s, const stream_render_params &p,
                          std::vector<uint8_t> &out_jpeg, std::string *err);

// GET /histogram.jpg and GET /histogram.mjpeg.
// `quit` (optional) ends open streams on shutdown.
void install_histogram_stream_endpoints(httplib::Server &svr,
                                        const pixscope::SnapshotChannel *channel,
                                        stream_render_params (*params)(),
                                        const std::atomic<bool> *quit);
