// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_CORE_COLOR_UTILS_H_
#define MARKPLACE_CORE_COLOR_UTILS_H_

#include <cstdint>

namespace markplace {
namespace internal {

/// Straight-alpha color components in [0, 1].
struct RgbaF {
  double r;
  double g;
  double b;
  double a;
};

inline uint8_t AlphaOf(uint32_t argb) { return (argb >> 24) & 0xFF; }
inline uint8_t RedOf(uint32_t argb) { return (argb >> 16) & 0xFF; }
inline uint8_t GreenOf(uint32_t argb) { return (argb >> 8) & 0xFF; }
inline uint8_t BlueOf(uint32_t argb) { return argb & 0xFF; }

/// Parse a hex color string into ARGB (0xAARRGGBB).
/// Supports: "#RGB", "#RRGGBB", "#RRGGBBAA" (with or without '#').
/// Returns false on parse failure.
bool ColorFromHex(const char* hex, uint32_t* out_argb);

/// Multiply the alpha channel by `opacity` (clamped to [0, 1]).
uint32_t ApplyOpacity(uint32_t argb, double opacity);

/// Split ARGB into floating-point components.
RgbaF ToRgbaF(uint32_t argb);

/// Write the premultiplied BGRA bytes of `argb` to `out[4]`.
void PremultipliedBgra(uint32_t argb, uint8_t* out);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_CORE_COLOR_UTILS_H_
