// Copyright 2026 The markplace Authors

#include "core/color_utils.h"

#include <cmath>
#include <cstring>

namespace markplace {
namespace internal {

namespace {

// Parse a single hex character to its value (0-15). Returns -1 on failure.
int HexCharToVal(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Two hex digits starting at `p`, or -1.
int HexByte(const char* p) {
  int hi = HexCharToVal(p[0]);
  int lo = HexCharToVal(p[1]);
  if (hi < 0 || lo < 0) return -1;
  return hi * 16 + lo;
}

uint32_t PackArgb(uint32_t a, uint32_t r, uint32_t g, uint32_t b) {
  return (a << 24) | (r << 16) | (g << 8) | b;
}

}  // namespace

bool ColorFromHex(const char* hex, uint32_t* out_argb) {
  if (!hex || !out_argb) return false;

  if (hex[0] == '#') ++hex;
  size_t len = std::strlen(hex);

  if (len == 3) {
    int r = HexCharToVal(hex[0]);
    int g = HexCharToVal(hex[1]);
    int b = HexCharToVal(hex[2]);
    if (r < 0 || g < 0 || b < 0) return false;
    // 0xF -> 0xFF
    *out_argb = PackArgb(255, r * 17, g * 17, b * 17);
    return true;
  }

  if (len == 6 || len == 8) {
    int r = HexByte(hex);
    int g = HexByte(hex + 2);
    int b = HexByte(hex + 4);
    int a = (len == 8) ? HexByte(hex + 6) : 255;
    if (r < 0 || g < 0 || b < 0 || a < 0) return false;
    *out_argb = PackArgb(a, r, g, b);
    return true;
  }

  return false;
}

uint32_t ApplyOpacity(uint32_t argb, double opacity) {
  if (!std::isfinite(opacity)) opacity = 1.0;
  if (opacity < 0.0) opacity = 0.0;
  if (opacity > 1.0) opacity = 1.0;
  uint32_t alpha =
      static_cast<uint32_t>(std::lround(AlphaOf(argb) * opacity));
  return (alpha << 24) | (argb & 0x00FFFFFF);
}

RgbaF ToRgbaF(uint32_t argb) {
  return RgbaF{RedOf(argb) / 255.0, GreenOf(argb) / 255.0,
               BlueOf(argb) / 255.0, AlphaOf(argb) / 255.0};
}

void PremultipliedBgra(uint32_t argb, uint8_t* out) {
  uint32_t a = AlphaOf(argb);
  out[0] = static_cast<uint8_t>((BlueOf(argb) * a + 127) / 255);
  out[1] = static_cast<uint8_t>((GreenOf(argb) * a + 127) / 255);
  out[2] = static_cast<uint8_t>((RedOf(argb) * a + 127) / 255);
  out[3] = static_cast<uint8_t>(a);
}

}  // namespace internal
}  // namespace markplace
