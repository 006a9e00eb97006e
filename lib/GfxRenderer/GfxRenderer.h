#pragma once

#include <GfxFont.h>
#include <PixelSurface.h>

#include <cstddef>
#include <cstdint>

#include "XBitmap.h"

// Draws text and packed images onto a borrowed PixelSurface, pixel for pixel
// the way Adafruit GFX does. Holds no state besides the surface reference.
//
// Three bit packings are in play and each has its own decoder:
//   GfxFont glyphs   - row-major, MSB-first, baseline positioned
//   built-in 5x7     - column-major, bit r = row r, top-left positioned
//   XBitmap images   - row-major, LSB-first, top-left positioned
class GfxRenderer {
  PixelSurface& surface;

 public:
  explicit GfxRenderer(PixelSurface& surface) : surface(surface) {}

  PixelSurface& getSurface() const { return surface; }
  int getScreenWidth() const { return surface.width(); }
  int getScreenHeight() const { return surface.height(); }

  // Drawing
  void drawPixel(int x, int y, Color color) const;
  void fillRect(int x, int y, int width, int height, Color color) const;

  // Text with an external font. `y` is the baseline.
  // Returns the glyph's xAdvance, or 0 when the font has no glyph for `code`.
  int drawGlyph(int x, int y, uint32_t code, const GfxFont& font, Color color) const;
  void drawText(const char* text, int x, int y, const GfxFont& font, Color color) const;
  // Centered in [x, x + width); an odd leftover pixel goes to the right.
  void drawTextCentered(const char* text, int x, int y, int width, const GfxFont& font, Color color) const;
  void drawTextRightAligned(const char* text, int rightX, int y, const GfxFont& font, Color color) const;

  // Text with the built-in 5x7 font. `y` is the top edge.
  void drawBuiltinChar(int x, int y, char c, Color color) const;
  void drawBuiltinText(const char* text, int x, int y, Color color) const;
  static int getBuiltinTextWidth(const char* text);

  // Font-or-builtin dispatch: a null font selects the built-in font.
  void drawText(const char* text, int x, int y, const GfxFont* font, Color color) const;
  void drawTextCentered(const char* text, int x, int y, int width, const GfxFont* font, Color color) const;
  void drawTextRightAligned(const char* text, int rightX, int y, const GfxFont* font, Color color) const;
  static int getTextWidth(const char* text, const GfxFont* font);
  static TextBounds getTextBounds(const char* text, const GfxFont* font);

  // Packed images. Unset bits are transparent.
  void drawPackedImage(int x, int y, const uint8_t* bytes, size_t byteCount, int width, int height,
                       Color color) const;
  // Nearest-neighbour resample of a srcWidth x srcHeight image to destWidth x destHeight.
  void drawPackedImageScaled(int x, int y, const uint8_t* bytes, size_t byteCount, int srcWidth, int srcHeight,
                             int destWidth, int destHeight, Color color) const;
  void drawXBitmap(const XBitmap& image, int x, int y, Color color) const;
  void drawXBitmapScaled(const XBitmap& image, int x, int y, int destWidth, int destHeight, Color color) const;
};
