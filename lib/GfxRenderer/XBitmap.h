#pragma once

#include <cstddef>
#include <cstdint>

// Non-owning view of a packed monochrome image in XBM layout: rows of
// ceil(width/8) bytes, LSB of each byte is the leftmost pixel. This is the
// opposite bit order to GfxFont glyph rows and must stay that way.
class XBitmap {
 public:
  XBitmap(const uint8_t* data, size_t size, int width, int height)
      : data(data), size(size), width(width), height(height) {}

  int getWidth() const { return width; }
  int getHeight() const { return height; }
  int rowStride() const { return static_cast<int>((static_cast<int64_t>(width) + 7) / 8); }

  // Bytes past `size` read as zero, so short buffers render as blank rows.
  bool isSet(int col, int row) const;

  /// True if width x height pixels fit in the supplied bytes.
  bool isComplete() const;

 private:
  const uint8_t* data;
  size_t size;
  int width;
  int height;
};
