#include "histogram_stream_endpoints.h"

#include <cstdio>

#include "histogram_render.h"
#include "jpeg_codec.h"
#include "snapshot_channel.h"

using pixscope::histogram_snapshot;

// Helper to add no-cache headers (live content).
static inline void set_no_cache_headers(httplib::Response& res) {
  res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
  res.set_header("Pragma", "no-cache");
  res.set_header("Expires", "0");
  // Helps some reverse proxies not buffer.
  res.set_header("X-Accel-Buffering", "no");
}

bool render_snapshot_jpeg(const histogram_snapshot &s, const stream_render_params &p,
                          std::vector<uint8_t> &out_jpeg, std::string *err) {
  pixscope::scope_canvas canvas;
  canvas.resize(p.w, p.h);
  pixscope::histogram_render(s, canvas);
  return pixscope::jpeg_encode_xrgb(canvas.px.data(), (int)canvas.w, (int)canvas.h,
                                    (int)canvas.w * 4, p.quality, out_jpeg, err);
}

void install_histogram_stream_endpoints(httplib::Server &svr,
                                        const pixscope::SnapshotChannel *channel,
                                        stream_render_params (*params)(),
                                        const std::atomic<bool> *quit) {
  svr.Get("/histogram.jpg", [channel, params](const httplib::Request&, httplib::Response &res) {
    set_no_cache_headers(res);
    histogram_snapshot s;
    if (!channel || !channel->latest(s)) {
      res.status = 503;
      res.set_content("no snapshot yet", "text/plain");
      return;
    }
    std::vector<uint8_t> jpeg;
    std::string err;
    if (!render_snapshot_jpeg(s, params ? params() : stream_render_params{}, jpeg, &err)) {
      fprintf(stderr, "[jpeg] histogram encode failed: %s\n", err.c_str());
      res.status = 500;
      res.set_content(err, "text/plain");
      return;
    }
    res.set_content(reinterpret_cast<const char*>(jpeg.data()), jpeg.size(), "image/jpeg");
  });

  // MJPEG stream of rendered snapshots, one part per published tick.
  svr.Get("/histogram.mjpeg", [channel, params, quit](const httplib::Request&, httplib::Response &res) {
    set_no_cache_headers(res);
    if (!channel) {
      res.status = 503;
      res.set_content("no snapshot channel", "text/plain");
      return;
    }

    // Content-Type includes boundary token "frame"
    res.set_content_provider(
      "multipart/x-mixed-replace; boundary=frame",
      [channel, params, quit](size_t /*offset*/, httplib::DataSink& sink) -> bool {
        uint64_t last_sent_seq = 0;
        std::vector<uint8_t> jpeg;

        while (!(quit && quit->load())) {
          histogram_snapshot s;
          if (!channel->wait_newer(last_sent_seq, 500, s)) {
            // Client disconnected while idle?
            if (sink.is_writable && !sink.is_writable()) return false;
            continue;
          }
          last_sent_seq = s.seq;

          std::string err;
          if (!render_snapshot_jpeg(s, params ? params() : stream_render_params{}, jpeg, &err)) {
            fprintf(stderr, "[jpeg] stream encode failed: %s\n", err.c_str());
            continue;
          }

          std::string header;
          header.reserve(128);
          header += "--frame\r\n";
          header += "Content-Type: image/jpeg\r\n";
          header += "Content-Length: " + std::to_string(jpeg.size()) + "\r\n";
          header += "\r\n";

          if (!sink.write(header.data(), header.size())) return false;
          if (!sink.write(reinterpret_cast<const char*>(jpeg.data()), jpeg.size())) return false;
          if (!sink.write("\r\n", 2)) return false;

          if (sink.is_writable && !sink.is_writable()) return false;
        }
        sink.done();
        return true;
      }
    );
  });
}
