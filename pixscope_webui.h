#pragma once
#include <atomic>
#include <cstdint>
#include <string>

namespace pixscope { class SnapshotChannel; }

// Wiring from main program:
void webui_set_config_json_provider(std::string (*fn)());
void webui_set_status_provider(std::string (*fn)());

// Activation toggle. Called on the HTTP thread; must only post a request.
void webui_set_active_handler(bool (*fn)(bool active));

// JPEG body from POST /api/frame. Returns false and fills err on a bad body.
void webui_set_frame_handler(bool (*fn)(const std::string &body, std::string &err));

void webui_set_snapshot_channel(const pixscope::SnapshotChannel *ch);
void webui_set_render_params(uint32_t w, uint32_t h, int jpeg_quality);
void webui_set_quit_flag(std::atomic<bool> *quit_flag);
void webui_set_listen_address(const std::string &addr);

// Start server:
void webui_start_detached(int port);

// Raises the quit flag, stops the server and waits until its thread and every
// request handler have returned. Objects handed to the providers may be
// destroyed only after this returned true.
bool webui_stop(int timeout_ms);
