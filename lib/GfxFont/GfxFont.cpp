#include "GfxFont.h"

#include <Logging.h>

#include <algorithm>
#include <utility>

GfxFont::GfxFont(std::string name, std::vector<uint8_t> bitmap, std::map<uint32_t, GfxGlyph> glyphs,
                 const uint32_t first, const uint32_t last, const int yAdvance)
    : name(std::move(name)),
      bitmap(std::move(bitmap)),
      glyphs(std::move(glyphs)),
      first(first),
      last(last),
      yAdvance(yAdvance) {}

GfxFont GfxFont::fromGlyphArray(const char* name, const uint8_t* bitmap, const size_t bitmapSize,
                                const GfxGlyph* glyphs, const uint32_t first, const uint32_t last,
                                const int yAdvance) {
  std::vector<uint8_t> bytes;
  if (bitmap != nullptr) {
    bytes.assign(bitmap, bitmap + bitmapSize);
  }

  std::map<uint32_t, GfxGlyph> glyphMap;
  if (glyphs != nullptr && last >= first) {
    for (uint32_t code = first; code <= last; code++) {
      glyphMap.emplace(code, glyphs[code - first]);
    }
  }

  GfxFont font(name ? name : "", std::move(bytes), std::move(glyphMap), first, last, yAdvance);
  LOG_DBG("FONT", "Loaded %s: %zu glyphs, %zu bitmap bytes", font.name.c_str(), font.glyphs.size(),
          font.bitmap.size());
  return font;
}

const GfxGlyph* GfxFont::getGlyph(const uint32_t code) const {
  const auto it = glyphs.find(code);
  if (it == glyphs.end()) {
    return nullptr;
  }
  return &it->second;
}

bool GfxFont::hasChar(const uint32_t code) const {
  return code >= first && code <= last && getGlyph(code) != nullptr;
}

bool GfxFont::glyphInBounds(const GfxGlyph& glyph) const {
  const size_t bits = static_cast<size_t>(glyph.width) * glyph.height;
  const size_t bytes = (bits + 7) / 8;
  return glyph.offset <= bitmap.size() && bytes <= bitmap.size() - glyph.offset;
}

int GfxFont::getTextWidth(const char* text) const {
  if (text == nullptr) {
    return 0;
  }

  int width = 0;
  for (const char* p = text; *p != '\0'; p++) {
    const GfxGlyph* glyph = getGlyph(static_cast<uint8_t>(*p));
    if (glyph) {
      width += glyph->xAdvance;
    }
  }
  return width;
}

TextBounds GfxFont::getTextBounds(const char* text) const {
  TextBounds bounds;
  if (text == nullptr) {
    return bounds;
  }

  // The first present glyph seeds minY/maxY; later ones can only widen them.
  bool seeded = false;
  for (const char* p = text; *p != '\0'; p++) {
    const GfxGlyph* glyph = getGlyph(static_cast<uint8_t>(*p));
    if (!glyph) {
      continue;
    }

    bounds.width += glyph->xAdvance;
    const int top = glyph->yOffset;
    const int bottom = glyph->yOffset + glyph->height;
    if (!seeded) {
      bounds.yMin = top;
      bounds.yMax = bottom;
      seeded = true;
    } else {
      bounds.yMin = std::min(bounds.yMin, top);
      bounds.yMax = std::max(bounds.yMax, bottom);
    }
  }

  bounds.height = bounds.yMax - bounds.yMin;
  return bounds;
}
