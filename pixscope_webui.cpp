#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <cstdio>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "histogram_json.h"
#include "histogram_stream_endpoints.h"
#include "pixscope_webui.h"
#include "snapshot_channel.h"

using nlohmann::json;

static std::mutex g_mtx;

static std::string (*g_cfg_json)() = nullptr;
static std::string (*g_status)() = nullptr;
static bool (*g_set_active)(bool) = nullptr;
static bool (*g_push_frame)(const std::string&, std::string&) = nullptr;

static const pixscope::SnapshotChannel *g_channel = nullptr;
static stream_render_params g_render{};
static std::atomic<bool> *g_quit = nullptr;
static std::string g_listen_addr = "0.0.0.0";

// Server thread lifetime, guarded by g_mtx.
static httplib::Server *g_svr = nullptr;
static bool g_server_running = false;
static std::condition_variable g_server_cv;

void webui_set_config_json_provider(std::string (*fn)()) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_cfg_json = fn;
}
void webui_set_status_provider(std::string (*fn)()) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_status = fn;
}
void webui_set_active_handler(bool (*fn)(bool active)) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_set_active = fn;
}
void webui_set_frame_handler(bool (*fn)(const std::string &body, std::string &err)) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_push_frame = fn;
}
void webui_set_snapshot_channel(const pixscope::SnapshotChannel *ch) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_channel = ch;
}
void webui_set_render_params(uint32_t w, uint32_t h, int jpeg_quality) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_render.w = w;
  g_render.h = h;
  g_render.quality = jpeg_quality;
}
void webui_set_quit_flag(std::atomic<bool> *quit_flag) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_quit = quit_flag;
}
void webui_set_listen_address(const std::string &addr) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_listen_addr = addr;
}

static stream_render_params render_params_snapshot() {
  std::lock_guard<std::mutex> lk(g_mtx);
  return g_render;
}

static const char *kIndexHtml = R"HTML(<!doctype html>
<html lang="en">
<head>
  <meta charset="utf-8"/>
  <meta name="viewport" content="width=device-width,initial-scale=1"/>
  <title>pixscope</title>
  <style>
    body { margin:0; font-family:system-ui, sans-serif; background:#0b0f14; color:#e8eefc; }
    header { padding:12px 16px; border-bottom:1px solid #243047; display:flex; gap:12px; align-items:center; }
    header h1 { font-size:15px; margin:0; }
    header .sp { flex:1; }
    button { background:#1b2436; color:#e8eefc; border:1px solid #243047; padding:8px 12px; border-radius:10px; cursor:pointer; font-weight:700; }
    main { padding:16px; display:grid; gap:14px; max-width:720px; }
    img { width:100%; image-rendering:pixelated; background:#000; border:1px solid #243047; border-radius:8px; }
    .status { font-family:ui-monospace, monospace; font-size:12px; white-space:pre; background:#121826; border:1px solid #243047; border-radius:12px; padding:10px; overflow:auto; max-height:260px; }
    .muted { color:#7d8aa6; font-size:12px; }
  </style>
</head>
<body>
  <header>
    <h1>RGB_HISTOGRAM // LIVE_FEED</h1>
    <div class="sp"></div>
    <button id="start">Start</button>
    <button id="stop">Stop</button>
    <label class="muted">push JPEG <input id="file" type="file" accept="image/jpeg"/></label>
  </header>
  <main>
    <img src="/histogram.mjpeg" alt="live histogram"/>
    <div class="status" id="status">loading...</div>
  </main>
<script>
async function post(url, body, type) {
  const r = await fetch(url, { method:'POST', body, headers:{'Content-Type': type} });
  return r.json().catch(() => ({}));
}
async function refreshStatus() {
  try {
    const r = await fetch('/api/status');
    document.getElementById('status').textContent = JSON.stringify(await r.json(), null, 2);
  } catch (e) {
    document.getElementById('status').textContent = 'status unavailable: ' + e;
  }
}
document.getElementById('start').onclick = () => post('/api/active', JSON.stringify({active:true}), 'application/json').then(refreshStatus);
document.getElementById('stop').onclick = () => post('/api/active', JSON.stringify({active:false}), 'application/json').then(refreshStatus);
document.getElementById('file').onchange = async (ev) => {
  const f = ev.target.files[0];
  if (!f) return;
  await post('/api/frame', await f.arrayBuffer(), 'image/jpeg');
  refreshStatus();
};
setInterval(refreshStatus, 1000);
refreshStatus();
</script>
</body>
</html>)HTML";

void webui_start_detached(int port) {
  {
    std::lock_guard<std::mutex> lk(g_mtx);
    g_server_running = true;
  }
  std::thread([port]() {
    httplib::Server svr;

    svr.Get("/", [](const httplib::Request&, httplib::Response &res) {
      res.set_content(kIndexHtml, "text/html; charset=utf-8");
    });

    svr.Get("/api/config", [](const httplib::Request&, httplib::Response &res) {
      std::string (*cfgp)() = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        cfgp = g_cfg_json;
      }
      if (!cfgp) {
        res.status = 500;
        res.set_content("{\"error\":\"no config provider\"}", "application/json");
        return;
      }
      res.set_content(cfgp(), "application/json");
    });

    svr.Get("/api/status", [](const httplib::Request&, httplib::Response &res) {
      std::string (*st)() = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        st = g_status;
      }
      if (!st) {
        res.status = 500;
        res.set_content("{\"error\":\"no status provider\"}", "application/json");
        return;
      }
      res.set_content(st(), "application/json");
    });

    svr.Get("/api/histogram", [](const httplib::Request&, httplib::Response &res) {
      const pixscope::SnapshotChannel *ch = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        ch = g_channel;
      }
      pixscope::histogram_snapshot s;
      if (!ch || !ch->latest(s)) {
        res.status = 503;
        res.set_content("{\"error\":\"no snapshot yet\"}", "application/json");
        return;
      }
      res.set_header("Cache-Control", "no-store");
      res.set_content(pixscope::snapshot_to_json(s).dump(), "application/json");
    });

    svr.Post("/api/active", [](const httplib::Request &req, httplib::Response &res) {
      bool (*fn)(bool) = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        fn = g_set_active;
      }
      if (!fn) {
        res.status = 500;
        res.set_content("{\"error\":\"no activation handler\"}", "application/json");
        return;
      }
      json j = json::parse(req.body, nullptr, false);
      if (j.is_discarded() || !j.is_object() || !j.contains("active") || !j["active"].is_boolean()) {
        res.status = 400;
        res.set_content("{\"error\":\"expected {\\\"active\\\":bool}\"}", "application/json");
        return;
      }
      bool want = j["active"].get<bool>();
      json out;
      out["ok"] = fn(want);
      out["active"] = want;
      res.set_content(out.dump(), "application/json");
    });

    svr.Post("/api/frame", [](const httplib::Request &req, httplib::Response &res) {
      bool (*fn)(const std::string&, std::string&) = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        fn = g_push_frame;
      }
      if (!fn) {
        res.status = 404;
        res.set_content("{\"error\":\"no frame handler\"}", "application/json");
        return;
      }
      std::string err;
      json out;
      if (!fn(req.body, err)) {
        res.status = 400;
        out["ok"] = false;
        out["error"] = err;
      } else {
        out["ok"] = true;
      }
      res.set_content(out.dump(), "application/json");
    });

    svr.Post("/api/quit", [](const httplib::Request&, httplib::Response &res) {
      std::atomic<bool> *q = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        q = g_quit;
      }
      if (q) q->store(true);
      res.set_content("{\"ok\":true}", "application/json");
    });

    const pixscope::SnapshotChannel *ch = nullptr;
    std::atomic<bool> *q = nullptr;
    std::string addr;
    {
      std::lock_guard<std::mutex> lk(g_mtx);
      ch = g_channel;
      q = g_quit;
      addr = g_listen_addr;
    }
    install_histogram_stream_endpoints(svr, ch, &render_params_snapshot, q);

    {
      std::lock_guard<std::mutex> lk(g_mtx);
      g_svr = &svr;
    }
    if (!(q && q->load())) {
      fprintf(stderr, "[webui] listening on %s:%d\n", addr.c_str(), port);
      // listen() returns only after the worker pool has drained.
      if (!svr.listen(addr.c_str(), port) && !(q && q->load())) {
        fprintf(stderr, "[webui] listen on %s:%d failed\n", addr.c_str(), port);
      }
    }

    {
      std::lock_guard<std::mutex> lk(g_mtx);
      g_svr = nullptr;
      g_server_running = false;
    }
    g_server_cv.notify_all();
  }).detach();
}

bool webui_stop(int timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  std::unique_lock<std::mutex> lk(g_mtx);
  if (g_quit) g_quit->store(true);
  while (g_server_running) {
    // Repeated: a stop() issued before listen() started is a no-op in httplib.
    if (g_svr) g_svr->stop();
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      fprintf(stderr, "[webui] server did not stop within %d ms\n", timeout_ms);
      return false;
    }
    auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(100));
    g_server_cv.wait_for(lk, slice);
  }
  return true;
}
