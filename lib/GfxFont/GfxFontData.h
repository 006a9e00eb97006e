#pragma once

#include <cstdint>

/// Font info per character, same fields as the Adafruit GFX GFXglyph
typedef struct {
  uint32_t offset;    /// Byte offset of the glyph's first row in the font bitmap
  uint16_t width;     /// Bitmap width in pixels (0 for invisible glyphs)
  uint16_t height;    /// Bitmap height in pixels
  uint16_t xAdvance;  /// Cursor delta after drawing
  int16_t xOffset;    /// Cursor to left edge of the bitmap
  int16_t yOffset;    /// Baseline to top edge of the bitmap (negative = above)
} GfxGlyph;

/// Ink extents of a string relative to its baseline
struct TextBounds {
  int width = 0;
  int height = 0;
  int yMin = 0;
  int yMax = 0;
};
