// Copyright 2026 The markplace Authors
//
// C++ RAII wrapper for the markplace C API.
// Header-only, just include this file.  Requires C++17 or later.
//
// Usage:
//   #include "markplace/markplace.hpp"
//   markplace::Context ctx;
//   MarkPlaceSpec spec = markplace::default_spec();
//   std::vector<MarkPlaceTarget> targets = {{1024, 1024}, {1536, 1024}};
//   markplace::Session session(ctx, spec, targets, 0);
//   session.Tick();
//   MarkPlacePlacement p = session.placement(1);

#ifndef MARKPLACE_MARKPLACE_HPP_
#define MARKPLACE_MARKPLACE_HPP_

#include "markplace/markplace.h"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace markplace {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(MarkPlaceError code, const char* msg)
      : std::runtime_error(msg ? msg : "markplace error"), code_(code) {}
  MarkPlaceError code() const noexcept { return code_; }

 private:
  MarkPlaceError code_;
};

// ---------------------------------------------------------------------------
// Image  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Image {
 public:
  Image() noexcept = default;
  explicit Image(MarkPlaceImage* raw) noexcept : raw_(raw) {}
  Image(int width, int height, uint32_t argb)
      : raw_(markplace_image_create(width, height, argb)) {
    if (!raw_) throw Error(kMarkPlaceErrorInvalidParam, "Image creation failed");
  }
  ~Image() { markplace_image_destroy(raw_); }

  Image(Image&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Image& operator=(Image&& o) noexcept {
    if (this != &o) {
      markplace_image_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;

  explicit operator bool() const noexcept { return raw_ != nullptr; }
  MarkPlaceImage* get() const noexcept { return raw_; }

  int width() const noexcept { return markplace_image_get_width(raw_); }
  int height() const noexcept { return markplace_image_get_height(raw_); }
  int stride() const noexcept { return markplace_image_get_stride(raw_); }
  const uint8_t* data() const noexcept { return markplace_image_get_data(raw_); }

 private:
  MarkPlaceImage* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(markplace_context_create()) {
    if (!raw_)
      throw Error(kMarkPlaceErrorNotInitialized, "Context creation failed");
  }
  explicit Context(const MarkPlaceConfig& config)
      : raw_(markplace_context_create_with_config(&config)) {
    if (!raw_)
      throw Error(kMarkPlaceErrorNotInitialized, "Context creation failed");
  }
  ~Context() { markplace_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      markplace_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  MarkPlaceContext* get() const noexcept { return raw_; }

  MarkPlaceError last_error() const { return markplace_get_last_error(raw_); }
  const char* last_error_message() const {
    return markplace_get_last_error_message(raw_);
  }

  // -- Fonts and icons --

  void RegisterFont(const std::string& key, const std::string& family,
                    const std::string& display_name, bool ready) {
    check(markplace_font_register(raw_, key.c_str(), family.c_str(),
                                  display_name.c_str(), ready ? 1 : 0));
  }
  void NotifyFontReady(const std::string& key) {
    check(markplace_font_notify_ready(raw_, key.c_str()));
  }
  bool font_ready(const std::string& key) {
    return markplace_font_is_ready(raw_, key.c_str()) != 0;
  }
  void NotifyIconDecoded(const std::string& ref, int width, int height,
                         const uint8_t* bgra = nullptr, int stride = 0) {
    check(markplace_icon_notify_decoded(raw_, ref.c_str(), width, height, bgra,
                                        stride));
  }
  void NotifyIconFailed(const std::string& ref) {
    check(markplace_icon_notify_failed(raw_, ref.c_str()));
  }

  // -- Text metrics --

  void SetTextMeasureCallback(markplace_text_measure_callback_t callback,
                              void* userdata) {
    markplace_set_text_measure_callback(raw_, callback, userdata);
  }
  bool text_measure_supported() {
    return markplace_text_measure_is_supported(raw_) != 0;
  }

  // -- Measurement cache --

  int cache_size() { return markplace_cache_size(raw_); }
  void ClearCache() { markplace_cache_clear(raw_); }

  // -- Rendering --

  bool render_supported() { return markplace_render_is_supported(raw_) != 0; }

  MarkPlacePlacement RenderOverlay(Image& image, const MarkPlaceSpec& spec) {
    MarkPlacePlacement placement = {};
    check(markplace_render_overlay(raw_, image.get(), &spec, &placement));
    return placement;
  }

 private:
  void check(MarkPlaceError err) {
    if (err != kMarkPlaceOk)
      throw Error(err, markplace_get_last_error_message(raw_));
  }

  MarkPlaceContext* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Session  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Session {
 public:
  using PatchHandler = std::function<void(const MarkPlacePositionPatch&)>;

  Session(Context& ctx, const MarkPlaceSpec& spec,
          const std::vector<MarkPlaceTarget>& targets, int main_index)
      : raw_(markplace_session_create(ctx.get(), &spec, targets.data(),
                                      static_cast<int>(targets.size()),
                                      main_index)),
        ctx_(&ctx) {
    if (!raw_) throw Error(ctx.last_error(), ctx.last_error_message());
  }
  ~Session() { markplace_session_destroy(raw_); }

  Session(Session&& o) noexcept
      : raw_(o.raw_), ctx_(o.ctx_), handler_(std::move(o.handler_)) {
    o.raw_ = nullptr;
  }
  Session& operator=(Session&& o) noexcept {
    if (this != &o) {
      markplace_session_destroy(raw_);
      raw_ = o.raw_;
      ctx_ = o.ctx_;
      handler_ = std::move(o.handler_);
      o.raw_ = nullptr;
    }
    return *this;
  }
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  MarkPlaceSession* get() const noexcept { return raw_; }

  void SetSpec(const MarkPlaceSpec& spec) {
    check(markplace_session_set_spec(raw_, &spec));
  }

  /// String fields stay valid until the next SetSpec or drag.
  MarkPlaceSpec spec() {
    MarkPlaceSpec out = {};
    check(markplace_session_get_spec(raw_, &out));
    return out;
  }

  void Tick() { markplace_session_tick(raw_); }

  int target_count() { return markplace_session_target_count(raw_); }

  MarkPlacePlacement placement(int index) {
    MarkPlacePlacement out = {};
    check(markplace_session_get_placement(raw_, index, &out));
    return out;
  }

  int measure_count() { return markplace_session_measure_count(raw_); }

  /// Receive drag patches (empty function = none).
  void OnPatch(PatchHandler handler) {
    if (!handler) {
      handler_.reset();
      markplace_session_set_patch_callback(raw_, nullptr, nullptr);
      return;
    }
    handler_ = std::make_unique<PatchHandler>(std::move(handler));
    markplace_session_set_patch_callback(raw_, &Session::Trampoline,
                                         handler_.get());
  }

  /// Returns false if a Down event did not hit the overlay.
  bool PointerDown(int pointer_id, double x, double y) {
    return send(kMarkPlacePointerDown, pointer_id, x, y);
  }
  void PointerMove(int pointer_id, double x, double y) {
    send(kMarkPlacePointerMove, pointer_id, x, y);
  }
  void PointerUp(int pointer_id, double x, double y) {
    send(kMarkPlacePointerUp, pointer_id, x, y);
  }
  void PointerCancel(int pointer_id) {
    send(kMarkPlacePointerCancel, pointer_id, 0.0, 0.0);
  }

  bool dragging() { return markplace_session_is_dragging(raw_) != 0; }

 private:
  static void Trampoline(const MarkPlacePositionPatch* patch, void* userdata) {
    (*static_cast<PatchHandler*>(userdata))(*patch);
  }

  bool send(MarkPlacePointerEventType type, int pointer_id, double x,
            double y) {
    MarkPlacePointerEvent e = {type, pointer_id, x, y};
    MarkPlaceError err = markplace_session_pointer_event(raw_, &e);
    if (err == kMarkPlaceErrorDragRejected) return false;
    check(err);
    return true;
  }

  void check(MarkPlaceError err) {
    if (err != kMarkPlaceOk) throw Error(err, ctx_->last_error_message());
  }

  MarkPlaceSession* raw_ = nullptr;
  Context* ctx_ = nullptr;
  std::unique_ptr<PatchHandler> handler_;
};

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

inline MarkPlaceSpec default_spec(const char* font_key = nullptr) {
  MarkPlaceSpec spec = {};
  markplace_spec_init_default(&spec, font_key);
  return spec;
}

inline MarkPlacePlacement resolve_placement(const MarkPlaceSpec& spec,
                                            const MarkPlaceTarget& target,
                                            double content_width,
                                            double content_height) {
  MarkPlacePlacement out = {};
  auto err = markplace_resolve_placement(&spec, &target, content_width,
                                         content_height, &out);
  if (err != kMarkPlaceOk) throw Error(err, "resolve_placement failed");
  return out;
}

inline std::vector<MarkPlaceTarget> select_preview_sizes(
    const std::vector<MarkPlaceTarget>& sizes) {
  std::vector<MarkPlaceTarget> out(4);
  int n = markplace_select_preview_sizes(
      sizes.data(), static_cast<int>(sizes.size()), out.data(),
      static_cast<int>(out.size()));
  if (n < 0) throw Error(kMarkPlaceErrorInvalidParam, "Invalid preview sizes");
  out.resize(static_cast<size_t>(n));
  return out;
}

inline uint32_t from_hex(const char* hex) {
  uint32_t argb = 0;
  auto err = markplace_color_from_hex(hex, &argb);
  if (err != kMarkPlaceOk) throw Error(err, "Invalid hex color");
  return argb;
}

inline const char* version_string() { return markplace_version_string(); }

}  // namespace markplace

#endif  // MARKPLACE_MARKPLACE_HPP_
