#include "GfxRenderer.h"

#include <BuiltinFont.h>
#include <Logging.h>

#include <cmath>
#include <cstring>

namespace {
// Floor division for a positive divisor; `/` truncates toward zero.
int floorDiv(const int a, const int b) {
  const int q = a / b;
  return (a % b != 0 && a < 0) ? q - 1 : q;
}
}  // namespace

void GfxRenderer::drawPixel(const int x, const int y, const Color color) const { surface.setPixel(x, y, color); }

void GfxRenderer::fillRect(const int x, const int y, const int width, const int height, const Color color) const {
  surface.fillRect(x, y, width, height, color);
}

// =============================================================================
// External fonts
// =============================================================================
//
// Glyph bitmaps are one continuous bit stream per glyph, starting at
// glyph.offset, row-major with no row padding. Bit i lives in byte
// offset + i/8 at position 7 - i%8 (MSB first). A set bit is drawn at
//   (x + xOffset + col, y + yOffset + row)
// where (x, y) is the cursor on the baseline. Nothing is clipped here.

int GfxRenderer::drawGlyph(const int x, const int y, const uint32_t code, const GfxFont& font,
                           const Color color) const {
  const GfxGlyph* glyph = font.getGlyph(code);
  if (!glyph) {
    LOG_DBG("GFX", "No glyph for code %u in %s", static_cast<unsigned>(code), font.getName().c_str());
    return 0;
  }

  if (glyph->width == 0) {
    return glyph->xAdvance;
  }

  if (!font.glyphInBounds(*glyph)) {
    LOG_ERR("GFX", "Glyph %u of %s overruns the bitmap (offset %u)", static_cast<unsigned>(code),
            font.getName().c_str(), static_cast<unsigned>(glyph->offset));
  }

  const int screenXBase = x + glyph->xOffset;
  const int screenYBase = y + glyph->yOffset;
  size_t bitIndex = 0;
  for (int glyphY = 0; glyphY < glyph->height; glyphY++) {
    for (int glyphX = 0; glyphX < glyph->width; glyphX++, bitIndex++) {
      const uint8_t byte = font.bitmapByte(glyph->offset + (bitIndex >> 3));
      const uint8_t bitPosition = 7 - (bitIndex & 7);
      if ((byte >> bitPosition) & 1) {
        surface.setPixel(screenXBase + glyphX, screenYBase + glyphY, color);
      }
    }
  }

  return glyph->xAdvance;
}

void GfxRenderer::drawText(const char* text, const int x, const int y, const GfxFont& font, const Color color) const {
  // cannot draw a NULL / empty string
  if (text == nullptr || *text == '\0') {
    return;
  }

  int cursorX = x;
  for (const char* p = text; *p != '\0'; p++) {
    cursorX += drawGlyph(cursorX, y, static_cast<uint8_t>(*p), font, color);
  }
}

void GfxRenderer::drawTextCentered(const char* text, const int x, const int y, const int width, const GfxFont& font,
                                   const Color color) const {
  const int textWidth = font.getTextWidth(text);
  drawText(text, x + floorDiv(width - textWidth, 2), y, font, color);
}

void GfxRenderer::drawTextRightAligned(const char* text, const int rightX, const int y, const GfxFont& font,
                                       const Color color) const {
  drawText(text, rightX - font.getTextWidth(text), y, font, color);
}

// =============================================================================
// Built-in 5x7 font
// =============================================================================

void GfxRenderer::drawBuiltinChar(const int x, const int y, const char c, const Color color) const {
  const uint8_t* columns = builtinfont::glyph(static_cast<uint8_t>(c));
  if (!columns) {
    return;
  }

  for (int col = 0; col < builtinfont::WIDTH; col++) {
    const uint8_t column = columns[col];
    for (int row = 0; row < builtinfont::HEIGHT; row++) {
      if ((column >> row) & 1) {
        surface.setPixel(x + col, y + row, color);
      }
    }
  }
}

void GfxRenderer::drawBuiltinText(const char* text, const int x, const int y, const Color color) const {
  if (text == nullptr) {
    return;
  }

  // Unsupported bytes draw nothing but still take up a cell.
  int cursorX = x;
  for (const char* p = text; *p != '\0'; p++) {
    drawBuiltinChar(cursorX, y, *p, color);
    cursorX += builtinfont::ADVANCE;
  }
}

int GfxRenderer::getBuiltinTextWidth(const char* text) {
  if (text == nullptr) {
    return 0;
  }
  return static_cast<int>(strlen(text)) * builtinfont::ADVANCE;
}

// =============================================================================
// Font selection
// =============================================================================

void GfxRenderer::drawText(const char* text, const int x, const int y, const GfxFont* font, const Color color) const {
  if (font) {
    drawText(text, x, y, *font, color);
  } else {
    drawBuiltinText(text, x, y, color);
  }
}

void GfxRenderer::drawTextCentered(const char* text, const int x, const int y, const int width, const GfxFont* font,
                                   const Color color) const {
  if (font) {
    drawTextCentered(text, x, y, width, *font, color);
  } else {
    drawBuiltinText(text, x + floorDiv(width - getBuiltinTextWidth(text), 2), y, color);
  }
}

void GfxRenderer::drawTextRightAligned(const char* text, const int rightX, const int y, const GfxFont* font,
                                       const Color color) const {
  if (font) {
    drawTextRightAligned(text, rightX, y, *font, color);
  } else {
    drawBuiltinText(text, rightX - getBuiltinTextWidth(text), y, color);
  }
}

int GfxRenderer::getTextWidth(const char* text, const GfxFont* font) {
  return font ? font->getTextWidth(text) : getBuiltinTextWidth(text);
}

TextBounds GfxRenderer::getTextBounds(const char* text, const GfxFont* font) {
  if (font) {
    return font->getTextBounds(text);
  }

  // Built-in glyphs always span the full cell below the top edge
  TextBounds bounds;
  bounds.width = getBuiltinTextWidth(text);
  bounds.height = builtinfont::HEIGHT;
  bounds.yMin = 0;
  bounds.yMax = builtinfont::HEIGHT;
  return bounds;
}

// =============================================================================
// Packed images
// =============================================================================

void GfxRenderer::drawPackedImage(const int x, const int y, const uint8_t* bytes, const size_t byteCount,
                                  const int width, const int height, const Color color) const {
  drawXBitmap(XBitmap(bytes, byteCount, width, height), x, y, color);
}

void GfxRenderer::drawPackedImageScaled(const int x, const int y, const uint8_t* bytes, const size_t byteCount,
                                        const int srcWidth, const int srcHeight, const int destWidth,
                                        const int destHeight, const Color color) const {
  drawXBitmapScaled(XBitmap(bytes, byteCount, srcWidth, srcHeight), x, y, destWidth, destHeight, color);
}

void GfxRenderer::drawXBitmap(const XBitmap& image, const int x, const int y, const Color color) const {
  if (!image.isComplete()) {
    LOG_ERR("GFX", "XBitmap %dx%d is shorter than its dimensions", image.getWidth(), image.getHeight());
  }

  for (int row = 0; row < image.getHeight(); row++) {
    for (int col = 0; col < image.getWidth(); col++) {
      if (image.isSet(col, row)) {
        surface.setPixel(x + col, y + row, color);
      }
    }
  }
}

void GfxRenderer::drawXBitmapScaled(const XBitmap& image, const int x, const int y, const int destWidth,
                                    const int destHeight, const Color color) const {
  if (!image.isComplete()) {
    LOG_ERR("GFX", "XBitmap %dx%d is shorter than its dimensions", image.getWidth(), image.getHeight());
  }

  if (destWidth <= 0 || destHeight <= 0) {
    return;
  }

  // srcCol = floor(destCol * (srcWidth / destWidth)), with the ratio taken in double first
  const double scaleX = static_cast<double>(image.getWidth()) / destWidth;
  const double scaleY = static_cast<double>(image.getHeight()) / destHeight;
  for (int destRow = 0; destRow < destHeight; destRow++) {
    const int srcRow = static_cast<int>(std::floor(destRow * scaleY));
    for (int destCol = 0; destCol < destWidth; destCol++) {
      const int srcCol = static_cast<int>(std::floor(destCol * scaleX));
      if (image.isSet(srcCol, srcRow)) {
        surface.setPixel(x + destCol, y + destRow, color);
      }
    }
  }
}
