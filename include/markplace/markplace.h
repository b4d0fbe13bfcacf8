// Copyright 2026 The markplace Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef MARKPLACE_MARKPLACE_H_
#define MARKPLACE_MARKPLACE_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32)
#if defined(MARKPLACE_BUILDING)
#define MARKPLACE_API __declspec(dllexport)
#else
#define MARKPLACE_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define MARKPLACE_API __attribute__((visibility("default")))
#else
#define MARKPLACE_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "markplace/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
// The engine is single-threaded and event driven:
//   - Each MarkPlaceContext is independent; different contexts may be used
//     from different threads.
//   - A context and every session created from it must be driven from ONE
//     thread (font/icon notifications, ticks, pointer events, queries).
//   - markplace_set_log_level() and markplace_set_log_callback() are
//     process-global and internally synchronized.
//   - Pure geometry helpers (markplace_compute_*, markplace_infer_*,
//     markplace_derive_*, markplace_resolve_placement, ...) are stateless and
//     safe to call from any thread.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct MarkPlaceContext MarkPlaceContext;
typedef struct MarkPlaceSession MarkPlaceSession;
typedef struct MarkPlaceImage MarkPlaceImage;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by markplace functions.
typedef enum MarkPlaceError {
  kMarkPlaceOk = 0,
  kMarkPlaceErrorNotInitialized = -1,
  kMarkPlaceErrorInvalidParam = -2,
  kMarkPlaceErrorOutOfMemory = -3,
  kMarkPlaceErrorNotSupported = -4,
  kMarkPlaceErrorNotReady = -5,        ///< Content not measurable yet
  kMarkPlaceErrorDragRejected = -6,    ///< Pointer not on a draggable overlay
  kMarkPlaceErrorConfigFailed = -7,    ///< Configuration file unreadable
  kMarkPlaceErrorRenderFailed = -8,    ///< Overlay rendering failed
  kMarkPlaceErrorUnknown = -99,
} MarkPlaceError;

/// Log severity levels for the internal logging system.
typedef enum MarkPlaceLogLevel {
  kMarkPlaceLogTrace = 0,   ///< Very detailed diagnostic info
  kMarkPlaceLogDebug = 1,   ///< Debug-level messages
  kMarkPlaceLogInfo = 2,    ///< Informational messages (default)
  kMarkPlaceLogWarn = 3,    ///< Warnings
  kMarkPlaceLogError = 4,   ///< Errors
  kMarkPlaceLogFatal = 5,   ///< Fatal / critical errors
} MarkPlaceLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to markplace_set_log_callback.
typedef void (*markplace_log_callback_t)(MarkPlaceLogLevel level,
                                         const char* message,
                                         void* userdata);

/// Canvas corner that offsets are measured from.
typedef enum MarkPlaceAnchor {
  kMarkPlaceAnchorTopLeft = 0,
  kMarkPlaceAnchorTopRight = 1,
  kMarkPlaceAnchorBottomLeft = 2,
  kMarkPlaceAnchorBottomRight = 3,
} MarkPlaceAnchor;

/// How offset_x / offset_y are interpreted.
typedef enum MarkPlacePositionMode {
  kMarkPlacePositionPixel = 0,  ///< Literal pixels from the anchor edges
  kMarkPlacePositionRatio = 1,  ///< Fraction of the target width / height
} MarkPlacePositionMode;

/// Icon placement relative to the text.
typedef enum MarkPlaceIconPosition {
  kMarkPlaceIconLeft = 0,
  kMarkPlaceIconRight = 1,
  kMarkPlaceIconTop = 2,
  kMarkPlaceIconBottom = 3,
} MarkPlaceIconPosition;

/// Which target dimension is compared to base_canvas_width to derive the
/// content scale factor.
typedef enum MarkPlaceScaleMode {
  kMarkPlaceScaleNone = 0,       ///< Content keeps its nominal pixel size
  kMarkPlaceScaleLongEdge = 1,
  kMarkPlaceScaleShortEdge = 2,
  kMarkPlaceScaleWidth = 3,
  kMarkPlaceScaleHeight = 4,
} MarkPlaceScaleMode;

/// Declarative watermark description.  Strings are borrowed; the engine
/// copies everything it keeps.
typedef struct MarkPlaceSpec {
  const char* text;             ///< UTF-8 overlay text (NULL = empty)
  const char* font_key;         ///< Font registry key (NULL = default font)
  double font_size_px;          ///< Font size at base_canvas_width (> 0)
  double opacity;               ///< [0, 1]
  MarkPlacePositionMode position_mode;
  MarkPlaceAnchor anchor;
  double offset_x;
  double offset_y;
  int icon_enabled;                    ///< Non-zero to show the icon
  const char* icon_image_ref;          ///< Icon handle (NULL = none)
  MarkPlaceIconPosition icon_position;
  double icon_gap_px;                  ///< 0 = a quarter of the text height
  double icon_scale;                   ///< Icon side relative to text height
  int border_enabled;
  int background_enabled;
  int rounded_background_enabled;
  uint32_t border_color;               ///< ARGB (0xAARRGGBB)
  uint32_t background_color;           ///< ARGB
  uint32_t text_color;                 ///< ARGB
  double border_width_px;
  double corner_radius_px;
  double base_canvas_width;            ///< Reference square size (> 0)
  MarkPlaceScaleMode adaptive_scale_mode;
} MarkPlaceSpec;

/// Size of one destination canvas (preview or final image).
typedef struct MarkPlaceTarget {
  double width;
  double height;
} MarkPlaceTarget;

/// Axis-aligned rectangle in target pixels.
typedef struct MarkPlaceRect {
  double x;
  double y;
  double width;
  double height;
} MarkPlaceRect;

/// Final overlay rectangle for one target.
typedef struct MarkPlacePlacement {
  double x;
  double y;
  double width;
  double height;
  double scale;                   ///< Preview scale used for the content
  int visible;                    ///< 0 while content is not measurable yet
  int provisional;                ///< Non-zero if width/height are estimates
  MarkPlaceAnchor active_anchor;  ///< Dominant anchor of this rectangle
} MarkPlacePlacement;

/// Distances from each canvas edge to the overlay rectangle.
typedef struct MarkPlaceEdgeDistances {
  double top;
  double right;
  double bottom;
  double left;
} MarkPlaceEdgeDistances;

/// Which two canvas edges an anchor measures its offsets from (non-zero =
/// active).  An edge-distance readout highlights these.
typedef struct MarkPlaceActiveEdges {
  int top;
  int right;
  int bottom;
  int left;
} MarkPlaceActiveEdges;

/// Position update emitted while dragging, in the spec's position mode.
typedef struct MarkPlacePositionPatch {
  MarkPlaceAnchor anchor;
  double offset_x;
  double offset_y;
} MarkPlacePositionPatch;

/// Pointer event kinds understood by markplace_session_pointer_event.
typedef enum MarkPlacePointerEventType {
  kMarkPlacePointerDown = 0,
  kMarkPlacePointerMove = 1,
  kMarkPlacePointerUp = 2,
  kMarkPlacePointerCancel = 3,
  kMarkPlacePointerCaptureLost = 4,
} MarkPlacePointerEventType;

/// Pointer event in main-target canvas coordinates.
typedef struct MarkPlacePointerEvent {
  MarkPlacePointerEventType type;
  int pointer_id;
  double x;
  double y;
} MarkPlacePointerEvent;

/// Callback receiving drag patches for the editor to fold into its spec.
typedef void (*markplace_patch_callback_t)(const MarkPlacePositionPatch* patch,
                                           void* userdata);

/// Host text-metrics callback.  Writes the laid-out size of `text` rendered
/// with `font_family` at `font_size_px` and returns non-zero on success.
typedef int (*markplace_text_measure_callback_t)(const char* text,
                                                 const char* font_family,
                                                 double font_size_px,
                                                 double* out_width,
                                                 double* out_height,
                                                 void* userdata);

/// Engine configuration.  Zero / NULL fields select the built-in default.
typedef struct MarkPlaceConfig {
  double stabilize_tolerance_px;     ///< Default 0.5
  int max_stabilize_frames;          ///< Default 30
  double estimate_char_width_ratio;  ///< Default 0.6
  double decoration_padding_ratio;   ///< Default 0.3
  const char* default_font_key;      ///< Default "dejavu-sans"
  const char* default_font_family;   ///< Default "DejaVu Sans"
  MarkPlaceLogLevel log_level;       ///< Default Info
} MarkPlaceConfig;

/// Pixel format of image data (BGRA, 8 bits per channel, premultiplied).
typedef enum MarkPlacePixelFormat {
  kMarkPlaceFormatBgra8 = 0,
} MarkPlacePixelFormat;

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create a context with the built-in configuration.
/// The caller must destroy it with markplace_context_destroy().
///
/// @return A new context, or NULL on failure.
MARKPLACE_API MarkPlaceContext* markplace_context_create(void);

/// Create a context with an explicit configuration (NULL = defaults).
MARKPLACE_API MarkPlaceContext* markplace_context_create_with_config(
    const MarkPlaceConfig* config);

/// Destroy a context.  Destroy every session created from it first.
/// Passing NULL is a no-op.
MARKPLACE_API void markplace_context_destroy(MarkPlaceContext* ctx);

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

/// Get the error code of the last failed operation on this context.
MARKPLACE_API MarkPlaceError markplace_get_last_error(
    const MarkPlaceContext* ctx);

/// Get a human-readable error message for the last failed operation.
/// The returned string is valid until the next call on this context.
MARKPLACE_API const char* markplace_get_last_error_message(
    const MarkPlaceContext* ctx);

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

/// Fill `out_config` with the built-in defaults.
MARKPLACE_API void markplace_config_init_default(MarkPlaceConfig* out_config);

/// Load a `key = value` configuration file on top of the defaults.
/// NULL path = $XDG_CONFIG_HOME/markplace/markplace.ini.
/// String fields point into storage owned by the library and stay valid
/// until the next call of this function.
///
/// @return kMarkPlaceOk, or kMarkPlaceErrorConfigFailed if the file cannot be
///         read.
MARKPLACE_API MarkPlaceError markplace_config_load_file(
    const char* path, MarkPlaceConfig* out_config);

// ---------------------------------------------------------------------------
// Watermark spec helpers
// ---------------------------------------------------------------------------

/// Fill `out_spec` with the default watermark.  `font_key` is borrowed.
MARKPLACE_API void markplace_spec_init_default(MarkPlaceSpec* out_spec,
                                               const char* font_key);

/// Repair non-finite or out-of-range fields in place.
MARKPLACE_API void markplace_spec_normalize(MarkPlaceSpec* spec);

/// Convert the stored offsets to another position mode (explicit toggle).
/// Pixel -> Ratio divides by base_canvas_width, Ratio -> Pixel multiplies.
MARKPLACE_API MarkPlaceError markplace_spec_convert_position_mode(
    MarkPlaceSpec* spec, MarkPlacePositionMode new_mode);

/// Write the content signature (cache key) of `spec` into `buf`.
///
/// @return Length of the full signature, or -1 on invalid parameters.
MARKPLACE_API int markplace_spec_content_signature(const MarkPlaceSpec* spec,
                                                   char* buf, int buf_size);

// ---------------------------------------------------------------------------
// Geometry (pure functions)
// ---------------------------------------------------------------------------

/// Scale factor applied to font / icon / decoration for `target`.
MARKPLACE_API double markplace_compute_preview_scale(
    const MarkPlaceSpec* spec, const MarkPlaceTarget* target);

/// Offsets of `spec` in target pixels.
MARKPLACE_API MarkPlaceError markplace_compute_pixel_offset(
    const MarkPlaceSpec* spec, const MarkPlaceTarget* target,
    double* out_dx, double* out_dy);

/// Overlap area of two rectangles (0 when disjoint).
MARKPLACE_API double markplace_rect_overlap_area(const MarkPlaceRect* a,
                                                 const MarkPlaceRect* b);

/// Corner quadrant with the greatest overlap with `box`.
MARKPLACE_API MarkPlaceAnchor markplace_infer_dominant_anchor(
    const MarkPlaceRect* box, double canvas_width, double canvas_height,
    MarkPlaceAnchor fallback);

/// Per-edge offsets of `box` measured from `anchor`.
MARKPLACE_API MarkPlaceError markplace_derive_offsets(
    MarkPlaceAnchor anchor, const MarkPlaceRect* box, double canvas_width,
    double canvas_height, double* out_offset_x, double* out_offset_y);

/// Distances of `box` from every canvas edge (right/bottom floored at 0).
MARKPLACE_API MarkPlaceError markplace_compute_edge_distances(
    const MarkPlaceRect* box, double canvas_width, double canvas_height,
    MarkPlaceEdgeDistances* out_distances);

/// Edges that `anchor` measures its offsets from.
MARKPLACE_API MarkPlaceError markplace_anchor_active_edges(
    MarkPlaceAnchor anchor, MarkPlaceActiveEdges* out_edges);

/// Resolve the overlay rectangle for a measured content box.
MARKPLACE_API MarkPlaceError markplace_resolve_placement(
    const MarkPlaceSpec* spec, const MarkPlaceTarget* target,
    double content_width, double content_height,
    MarkPlacePlacement* out_placement);

/// Pick up to 4 representative non-square preview sizes.
///
/// @return Number of targets written to `out_targets`, or -1 on error.
MARKPLACE_API int markplace_select_preview_sizes(const MarkPlaceTarget* sizes,
                                                 int count,
                                                 MarkPlaceTarget* out_targets,
                                                 int max_out);

// ---------------------------------------------------------------------------
// Fonts and icons
// ---------------------------------------------------------------------------

/// Register a font key.  `ready` = non-zero if the face is already usable.
MARKPLACE_API MarkPlaceError markplace_font_register(MarkPlaceContext* ctx,
                                                     const char* font_key,
                                                     const char* font_family,
                                                     const char* display_name,
                                                     int ready);

/// Notify that a registered font finished loading.
MARKPLACE_API MarkPlaceError markplace_font_notify_ready(
    MarkPlaceContext* ctx, const char* font_key);

/// @return Non-zero if the font (after fallback resolution) is ready.
MARKPLACE_API int markplace_font_is_ready(MarkPlaceContext* ctx,
                                          const char* font_key);

/// Notify that an icon finished decoding.  `bgra` may be NULL (size only);
/// otherwise it is copied.
MARKPLACE_API MarkPlaceError markplace_icon_notify_decoded(
    MarkPlaceContext* ctx, const char* icon_ref, int width, int height,
    const uint8_t* bgra, int stride);

/// Notify that an icon failed to load or decode.
MARKPLACE_API MarkPlaceError markplace_icon_notify_failed(
    MarkPlaceContext* ctx, const char* icon_ref);

/// Override the built-in text metrics backend (NULL restores it).
MARKPLACE_API void markplace_set_text_measure_callback(
    MarkPlaceContext* ctx, markplace_text_measure_callback_t callback,
    void* userdata);

/// @return Non-zero if text can be measured (backend or callback present).
MARKPLACE_API int markplace_text_measure_is_supported(MarkPlaceContext* ctx);

// ---------------------------------------------------------------------------
// Measurement cache
// ---------------------------------------------------------------------------

/// Number of entries in the context's shared measurement cache.
MARKPLACE_API int markplace_cache_size(MarkPlaceContext* ctx);

/// Drop every cached measurement (affects smoothness only).
MARKPLACE_API void markplace_cache_clear(MarkPlaceContext* ctx);

// ---------------------------------------------------------------------------
// Preview sessions
// ---------------------------------------------------------------------------

/// Open a preview session rendering `spec` on `target_count` targets.
/// `main_index` selects the drag-enabled target.
///
/// @return A new session, or NULL on failure.
MARKPLACE_API MarkPlaceSession* markplace_session_create(
    MarkPlaceContext* ctx, const MarkPlaceSpec* spec,
    const MarkPlaceTarget* targets, int target_count, int main_index);

/// Close a session.  Late font/icon completions are ignored afterwards.
MARKPLACE_API void markplace_session_destroy(MarkPlaceSession* session);

/// Replace the session's spec (each edit is a new value).
MARKPLACE_API MarkPlaceError markplace_session_set_spec(
    MarkPlaceSession* session, const MarkPlaceSpec* spec);

/// Copy the session's current spec.  String fields point into session storage
/// and stay valid until the next set_spec / drag on this session.
MARKPLACE_API MarkPlaceError markplace_session_get_spec(
    MarkPlaceSession* session, MarkPlaceSpec* out_spec);

/// Advance one animation frame (measurement stabilization).
MARKPLACE_API void markplace_session_tick(MarkPlaceSession* session);

/// @return Number of targets, or -1 on NULL.
MARKPLACE_API int markplace_session_target_count(MarkPlaceSession* session);

/// Current placement for target `index`.
MARKPLACE_API MarkPlaceError markplace_session_get_placement(
    MarkPlaceSession* session, int index, MarkPlacePlacement* out_placement);

/// Number of content measurements performed by this session.
MARKPLACE_API int markplace_session_measure_count(MarkPlaceSession* session);

/// Register the drag patch callback (NULL = none).
MARKPLACE_API void markplace_session_set_patch_callback(
    MarkPlaceSession* session, markplace_patch_callback_t callback,
    void* userdata);

/// Feed one pointer event for the main target.
MARKPLACE_API MarkPlaceError markplace_session_pointer_event(
    MarkPlaceSession* session, const MarkPlacePointerEvent* event);

/// @return Non-zero while a drag is in progress.
MARKPLACE_API int markplace_session_is_dragging(MarkPlaceSession* session);

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

/// @return Non-zero if overlay rendering is supported in this build.
MARKPLACE_API int markplace_render_is_supported(MarkPlaceContext* ctx);

/// Create a blank BGRA image filled with `argb`.
MARKPLACE_API MarkPlaceImage* markplace_image_create(int width, int height,
                                                     uint32_t argb);

MARKPLACE_API void markplace_image_destroy(MarkPlaceImage* image);
MARKPLACE_API int markplace_image_get_width(const MarkPlaceImage* image);
MARKPLACE_API int markplace_image_get_height(const MarkPlaceImage* image);
MARKPLACE_API int markplace_image_get_stride(const MarkPlaceImage* image);
MARKPLACE_API const uint8_t* markplace_image_get_data(
    const MarkPlaceImage* image);

/// Render the watermark of `spec` onto `image` (final output path).
/// Fonts and icons must already be ready.
MARKPLACE_API MarkPlaceError markplace_render_overlay(
    MarkPlaceContext* ctx, MarkPlaceImage* image, const MarkPlaceSpec* spec,
    MarkPlacePlacement* out_placement);

// ---------------------------------------------------------------------------
// Color utilities
// ---------------------------------------------------------------------------

/// Parse "#RGB", "#RRGGBB" or "#RRGGBBAA" (with or without '#') into ARGB.
/// @return kMarkPlaceOk on success.
MARKPLACE_API MarkPlaceError markplace_color_from_hex(const char* hex,
                                                      uint32_t* out_argb);

/// Multiply the alpha channel of `argb` by `opacity`.
MARKPLACE_API uint32_t markplace_color_apply_opacity(uint32_t argb,
                                                     double opacity);

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

/// Get the library version as a string (e.g. "1.0.0").
MARKPLACE_API const char* markplace_version_string(void);

/// Get the major version number.
MARKPLACE_API int markplace_version_major(void);

/// Get the minor version number.
MARKPLACE_API int markplace_version_minor(void);

/// Get the patch version number.
MARKPLACE_API int markplace_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum log level. Messages below this level are discarded.
/// Default level is kMarkPlaceLogInfo.
MARKPLACE_API void markplace_set_log_level(MarkPlaceLogLevel level);

/// Set a user-defined log callback.
///
/// When a callback is registered, all log messages (at or above the current
/// level) are forwarded to the callback in addition to the default stderr
/// output.  Pass NULL as @p callback to unregister a previous callback.
///
/// @param callback  The callback function, or NULL to unregister.
/// @param userdata  Opaque pointer passed through to the callback.
MARKPLACE_API void markplace_set_log_callback(
    markplace_log_callback_t callback, void* userdata);

/// Emit a log message at the given level through the markplace logging system.
///
/// This can be used by host applications that want their own messages to flow
/// through the same logging pipeline.
MARKPLACE_API void markplace_log(MarkPlaceLogLevel level, const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // MARKPLACE_MARKPLACE_H_
