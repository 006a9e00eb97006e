#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "GfxFontData.h"

// Immutable bitmap font. Glyph rows are packed MSB-first and concatenated in
// `bitmap`; codes in [first, last] may still be missing from `glyphs`.
class GfxFont {
 public:
  GfxFont(std::string name, std::vector<uint8_t> bitmap, std::map<uint32_t, GfxGlyph> glyphs, uint32_t first,
          uint32_t last, int yAdvance);

  /// Build from a dense glyph array covering first..last, as laid out in an
  /// Adafruit GFX font header. Every code in range is present.
  static GfxFont fromGlyphArray(const char* name, const uint8_t* bitmap, size_t bitmapSize, const GfxGlyph* glyphs,
                                uint32_t first, uint32_t last, int yAdvance);

  const std::string& getName() const { return name; }
  uint32_t getFirst() const { return first; }
  uint32_t getLast() const { return last; }
  int getYAdvance() const { return yAdvance; }
  size_t getBitmapSize() const { return bitmap.size(); }
  size_t getGlyphCount() const { return glyphs.size(); }

  /// Returns nullptr if the code has no glyph.
  const GfxGlyph* getGlyph(uint32_t code) const;
  bool hasChar(uint32_t code) const;

  /// Bitmap byte at `index`, or 0 past the end of the bitmap.
  uint8_t bitmapByte(size_t index) const { return index < bitmap.size() ? bitmap[index] : 0; }

  /// True if the glyph's pixel data lies entirely inside the bitmap.
  bool glyphInBounds(const GfxGlyph& glyph) const;

  /// Sum of xAdvance over present glyphs.
  int getTextWidth(const char* text) const;
  TextBounds getTextBounds(const char* text) const;

 private:
  std::string name;
  std::vector<uint8_t> bitmap;
  std::map<uint32_t, GfxGlyph> glyphs;
  uint32_t first;
  uint32_t last;
  int yAdvance;
};
