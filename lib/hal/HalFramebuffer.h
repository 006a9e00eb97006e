#pragma once

#include <cstddef>
#include <vector>

#include "PixelSurface.h"

// In-memory stand-in for the panel: one Color per pixel, row-major.
class HalFramebuffer : public PixelSurface {
 public:
  HalFramebuffer(int width, int height, Color fill = COLOR_WHITE);

  int width() const override { return displayWidth; }
  int height() const override { return displayHeight; }

  void setPixel(int x, int y, Color color) override;
  void fillRect(int x, int y, int w, int h, Color color) override;
  void clear(Color color);

  // Out-of-range reads return 0
  Color getPixel(int x, int y) const;
  size_t countPixels(Color color) const;

  const std::vector<Color>& getBuffer() const { return pixels; }

 private:
  bool contains(int x, int y) const { return x >= 0 && x < displayWidth && y >= 0 && y < displayHeight; }

  int displayWidth;
  int displayHeight;
  std::vector<Color> pixels;
};
