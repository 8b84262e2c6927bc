#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>
#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "analysis_loop.h"
#include "display_tick_scheduler.h"
#include "histogram_json.h"
#include "pixscope_webui.h"
#include "pushed_frame_source.h"
#include "scope_config.h"
#include "snapshot_channel.h"

using nlohmann::json;
using namespace pixscope;

// -------------------- Helpers --------------------
static int set_fd_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return -1;
  if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return -1;
  return 0;
}
static std::string slurp_file(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) return {};
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}
static bool write_file_atomic(const std::string &path, const std::string &data) {
  std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f.is_open()) return false;
    f << data;
    f.flush();
    if (!f.good()) return false;
  }
  if (rename(tmp.c_str(), path.c_str()) != 0) return false;
  return true;
}

// ---------------- raw terminal (q to quit) ----------------
static struct termios orig_termios;
static bool g_raw_mode = false;
static void disableRawMode(void) {
  if (g_raw_mode) tcsetattr(STDIN_FILENO, TCSAFLUSH, &orig_termios);
}
static void enableRawModeNonBlockingStdin(void) {
  if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &orig_termios) == 0) {
    g_raw_mode = true;
    atexit(disableRawMode);
    struct termios raw = orig_termios;
    raw.c_lflag &= ~(ECHO | ICANON | ISIG);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
  }
  // The supervisor polls stdin every refresh; it must never block there.
  if (set_fd_nonblocking(STDIN_FILENO) != 0) {
    fprintf(stderr, "[main] could not set stdin nonblocking: %s\n", strerror(errno));
  }
}

// ---------------- Global state ----------------
static std::mutex g_cfg_mtx;
static scope_config g_cfg;
static std::string g_cfg_path = "./pixscope_config.json";
static std::atomic<bool> g_quit{false};

// -1 = nothing requested, 0 = stop, 1 = start. Applied on the main thread.
static std::atomic<int> g_active_req{-1};

static PushedFrameSource *g_source = nullptr;
static AnalysisLoop *g_loop = nullptr;
static SnapshotChannel *g_channel = nullptr;

static scope_config cfg_snapshot() {
  std::lock_guard<std::mutex> lk(g_cfg_mtx);
  scope_config c = g_cfg;
  cfg_normalize(c);
  return c;
}
static bool save_config_locked() {
  std::string j = config_to_json(g_cfg);
  return write_file_atomic(g_cfg_path, j);
}

// ---------------- WebUI providers ----------------
static std::string config_json_provider() {
  return config_to_json(cfg_snapshot());
}

static std::string status_json() {
  json j;
  j["config"] = config_to_json_obj(cfg_snapshot());
  if (g_loop) j["loop"] = loop_stats_to_json(g_loop->stats());
  if (g_channel) j["snapshotSeq"] = g_channel->sequence();
  if (g_source) j["framesPushed"] = g_source->frames_pushed();
  j["activeRequest"] = g_active_req.load();
  return j.dump(2);
}

static bool request_active(bool active) {
  g_active_req.store(active ? 1 : 0);
  return true;
}

static bool push_frame_body(const std::string &body, std::string &err) {
  if (!g_source) { err = "no frame source"; return false; }
  if (body.empty()) { err = "empty body"; return false; }
  return g_source->push_jpeg(reinterpret_cast<const uint8_t*>(body.data()), body.size(), false, &err);
}

static void usage(const char *argv0) {
  fprintf(stderr,
    "Usage: %s [--config PATH] [--no-webui] [--webui-port N] [--listen ADDR]\n"
    "          [--capture WxH] [--hz N] [--no-vblank] [--still PATH.jpg] [--seed N]\n"
    "Press q to quit.\n",
    argv0
  );
}

int main(int argc, char **argv) {
  enableRawModeNonBlockingStdin();
  bool webui_enabled=true;

  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0 && i+1<argc) g_cfg_path=argv[++i];
  }

  // load config
  {
    scope_config loaded;
    std::string txt = slurp_file(g_cfg_path);
    if (!txt.empty()) {
      if (config_from_json_text(txt, loaded)) fprintf(stderr, "[config] loaded %s\n", g_cfg_path.c_str());
      else fprintf(stderr, "[config] config parse failed; using defaults\n");
    } else {
      fprintf(stderr, "[config] no config found; using defaults\n");
    }
    cfg_normalize(loaded);
    std::lock_guard<std::mutex> lk(g_cfg_mtx);
    g_cfg = loaded;
  }

  // CLI overrides
  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0) { i++; continue; }
    if (strcmp(argv[i],"--no-webui")==0) { webui_enabled=false; continue; }
    if (strcmp(argv[i],"-h")==0 || strcmp(argv[i],"--help")==0) { usage(argv[0]); return 0; }

    std::lock_guard<std::mutex> lk(g_cfg_mtx);
    if (strcmp(argv[i],"--webui-port")==0 && i+1<argc) g_cfg.webui_port=atoi(argv[++i]);
    else if (strcmp(argv[i],"--listen")==0 && i+1<argc) g_cfg.listen_addr=argv[++i];
    else if (strcmp(argv[i],"--capture")==0 && i+1<argc) {
      uint32_t w=0,h=0;
      if (!parse_dim(argv[++i], &w, &h)) { fprintf(stderr, "Bad --capture\n"); return 1; }
      g_cfg.capture_w=w; g_cfg.capture_h=h;
    } else if (strcmp(argv[i],"--hz")==0 && i+1<argc) g_cfg.refresh_hz=atoi(argv[++i]);
    else if (strcmp(argv[i],"--no-vblank")==0) g_cfg.vblank=false;
    else if (strcmp(argv[i],"--still")==0 && i+1<argc) g_cfg.still_image=argv[++i];
    else if (strcmp(argv[i],"--seed")==0 && i+1<argc) g_cfg.noise_seed=(uint32_t)strtoul(argv[++i], NULL, 10);
    else {
      fprintf(stderr, "Unknown argument: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  {
    std::lock_guard<std::mutex> lk(g_cfg_mtx);
    cfg_normalize(g_cfg);
    if (!save_config_locked()) fprintf(stderr, "[config] could not write %s\n", g_cfg_path.c_str());
  }

  scope_config snap = cfg_snapshot();

  PushedFrameSource source(snap.frame_stale_ms);
  SnapshotChannel channel;
  DisplayTickScheduler sched(snap.refresh_hz);

  if (snap.vblank) {
    std::string err;
    if (sched.open_vblank(snap.drm_card, &err)) {
      fprintf(stderr, "[pacer] pacing on DRM vblank\n");
    } else {
      fprintf(stderr, "[pacer] vblank unavailable (%s); using %d Hz timer\n", err.c_str(), snap.refresh_hz);
    }
  } else {
    fprintf(stderr, "[pacer] using %d Hz timer\n", snap.refresh_hz);
  }

  uint32_t seed = snap.noise_seed;
  if (seed == 0) {
    std::random_device rd;
    seed = rd();
  }
  AnalysisLoop loop(source, sched, channel, std::unique_ptr<NoiseSource>(new Mt19937Noise(seed)));
  {
    std::string err;
    if (!loop.init(snap.capture_w, snap.capture_h, &err)) {
      fprintf(stderr, "[engine] init failed: %s\n", err.c_str());
      return 1;
    }
  }

  g_source = &source;
  g_loop = &loop;
  g_channel = &channel;

  if (!snap.still_image.empty()) {
    std::string data = slurp_file(snap.still_image);
    std::string err;
    if (data.empty()) {
      fprintf(stderr, "[source] could not read still image %s\n", snap.still_image.c_str());
    } else if (!source.push_jpeg(reinterpret_cast<const uint8_t*>(data.data()), data.size(), true, &err)) {
      fprintf(stderr, "[source] still image %s rejected: %s\n", snap.still_image.c_str(), err.c_str());
    } else {
      fprintf(stderr, "[source] pinned still image %s\n", snap.still_image.c_str());
    }
  }

  // WEBUI STARTUP
  if (webui_enabled) {
    fprintf(stderr, "[webui] wiring handlers...\n");
    webui_set_config_json_provider(&config_json_provider);
    webui_set_status_provider(&status_json);
    webui_set_active_handler(&request_active);
    webui_set_frame_handler(&push_frame_body);
    webui_set_snapshot_channel(&channel);
    webui_set_render_params(snap.render_w, snap.render_h, snap.jpeg_quality);
    webui_set_quit_flag(&g_quit);
    webui_set_listen_address(snap.listen_addr);
    fprintf(stderr, "[webui] starting server thread on %s:%d ...\n", snap.listen_addr.c_str(), snap.webui_port);
    webui_start_detached(snap.webui_port);
    fprintf(stderr, "[webui] open http://<device-ip>:%d/\n", snap.webui_port);
  }

  if (snap.start_active) g_active_req.store(1);

  while (!g_quit.load()) {
    char ch;
    ssize_t n = read(STDIN_FILENO, &ch, 1);
    if (n==1 && ch=='q') { g_quit.store(true); break; }

    int req = g_active_req.exchange(-1);
    if (req == 1 && !loop.is_active()) {
      if (!loop.start()) fprintf(stderr, "[main] start refused\n");
    } else if (req == 0 && loop.is_active()) {
      loop.stop();
    }

    sched.run_once();
  }

  fprintf(stderr, "[main] shutting down...\n");
  // HTTP handlers hold pointers to source, channel and loop; drain them before
  // those go out of scope.
  if (webui_enabled && !webui_stop(5000)) {
    fprintf(stderr, "[main] web UI still busy; exiting without teardown\n");
    loop.stop();
    disableRawMode();
    fflush(stderr);
    _exit(1);
  }
  loop.stop();
  return 0;
}
