#include "HalFramebuffer.h"

#include <algorithm>
#include <cstdint>

HalFramebuffer::HalFramebuffer(const int width, const int height, const Color fill)
    : displayWidth(std::max(width, 0)),
      displayHeight(std::max(height, 0)),
      pixels(static_cast<size_t>(displayWidth) * static_cast<size_t>(displayHeight), fill) {}

// Called once per set glyph/image pixel. Keep it cheap.
void HalFramebuffer::setPixel(const int x, const int y, const Color color) {
  if (!contains(x, y)) {
    return;
  }
  pixels[static_cast<size_t>(y) * displayWidth + x] = color;
}

void HalFramebuffer::fillRect(const int x, const int y, const int w, const int h, const Color color) {
  if (w <= 0 || h <= 0) {
    return;
  }

  const int left = std::max(x, 0);
  const int top = std::max(y, 0);
  const int right = static_cast<int>(std::min<int64_t>(static_cast<int64_t>(x) + w, displayWidth));
  const int bottom = static_cast<int>(std::min<int64_t>(static_cast<int64_t>(y) + h, displayHeight));
  if (left >= right || top >= bottom) {
    return;
  }

  for (int fillY = top; fillY < bottom; fillY++) {
    auto row = pixels.begin() + static_cast<size_t>(fillY) * displayWidth;
    std::fill(row + left, row + right, color);
  }
}

void HalFramebuffer::clear(const Color color) { std::fill(pixels.begin(), pixels.end(), color); }

Color HalFramebuffer::getPixel(const int x, const int y) const {
  if (!contains(x, y)) {
    return 0;
  }
  return pixels[static_cast<size_t>(y) * displayWidth + x];
}

size_t HalFramebuffer::countPixels(const Color color) const {
  return static_cast<size_t>(std::count(pixels.begin(), pixels.end(), color));
}
