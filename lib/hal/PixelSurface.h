#pragma once

#include <cstdint>

// 0xRRGGBB
using Color = uint32_t;

constexpr Color COLOR_BLACK = 0x000000;
constexpr Color COLOR_WHITE = 0xFFFFFF;

// Pixel-addressable drawing target. Renderers only write to it; whatever
// falls outside width()/height() is the surface's to ignore.
class PixelSurface {
 public:
  virtual ~PixelSurface() = default;

  virtual int width() const = 0;
  virtual int height() const = 0;
  virtual void setPixel(int x, int y, Color color) = 0;
  virtual void fillRect(int x, int y, int w, int h, Color color) = 0;
};
