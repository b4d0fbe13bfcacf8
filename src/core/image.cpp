// Copyright 2026 The markplace Authors

#include "core/image.h"

#include <cstring>

#include "core/color_utils.h"

namespace markplace {
namespace internal {

namespace {

constexpr int kBytesPerPixel = 4;

// Upper bound on a single allocation (16384 x 16384 BGRA).
constexpr size_t kMaxImageBytes = static_cast<size_t>(16384) * 16384 * 4;

}  // namespace

Image::Image(int width, int height, int stride, std::vector<uint8_t> data)
    : width_(width),
      height_(height),
      stride_(stride),
      data_(std::move(data)) {}

void Image::Fill(uint32_t argb) {
  uint8_t px[kBytesPerPixel];
  PremultipliedBgra(argb, px);
  for (int y = 0; y < height_; ++y) {
    uint8_t* row = data_.data() + static_cast<size_t>(y) * stride_;
    for (int x = 0; x < width_; ++x) {
      std::memcpy(row + x * kBytesPerPixel, px, kBytesPerPixel);
    }
  }
}

// static
std::unique_ptr<Image> Image::Create(int width, int height) {
  if (width <= 0 || height <= 0) return nullptr;
  int stride = width * kBytesPerPixel;
  size_t total = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (total > kMaxImageBytes) return nullptr;
  std::vector<uint8_t> data(total, 0);
  return std::make_unique<Image>(width, height, stride, std::move(data));
}

// static
std::unique_ptr<Image> Image::CopyFrom(int width, int height, int stride,
                                       const uint8_t* pixels) {
  if (!pixels || stride < width * kBytesPerPixel) return nullptr;
  auto image = Create(width, height);
  if (!image) return nullptr;
  size_t row_bytes = static_cast<size_t>(width) * kBytesPerPixel;
  for (int y = 0; y < height; ++y) {
    std::memcpy(image->mutable_data() + static_cast<size_t>(y) * image->stride(),
                pixels + static_cast<size_t>(y) * stride, row_bytes);
  }
  return image;
}

}  // namespace internal
}  // namespace markplace
