// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_CORE_IMAGE_H_
#define MARKPLACE_CORE_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace markplace {
namespace internal {

/// Premultiplied BGRA pixel buffer used for render targets and icon bitmaps.
class Image {
 public:
  Image(int width, int height, int stride, std::vector<uint8_t> data);
  ~Image() = default;

  // Non-copyable, movable.
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;
  Image(Image&&) = default;
  Image& operator=(Image&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }
  int stride() const { return stride_; }
  const uint8_t* data() const { return data_.data(); }
  uint8_t* mutable_data() { return data_.data(); }
  size_t data_size() const { return data_.size(); }

  /// Fill every pixel with a straight-alpha ARGB color.
  void Fill(uint32_t argb);

  /// Create a zeroed (transparent) image with a tightly packed stride.
  static std::unique_ptr<Image> Create(int width, int height);

  /// Copy rows out of a caller buffer.  `stride` may exceed width * 4.
  static std::unique_ptr<Image> CopyFrom(int width, int height, int stride,
                                         const uint8_t* pixels);

 private:
  int width_;
  int height_;
  int stride_;
  std::vector<uint8_t> data_;
};

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_CORE_IMAGE_H_
