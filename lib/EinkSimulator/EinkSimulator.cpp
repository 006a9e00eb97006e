#include "EinkSimulator.h"

#include <Logging.h>

EinkSimulator::EinkSimulator(const DisplayConfig& config)
    : config(config),
      framebuffer(config.width, config.height, config.background),
      renderer(framebuffer),
      textColor(config.foreground) {
  LOG_INF("SIM", "Simulating %dx%d panel", framebuffer.width(), framebuffer.height());
}

void EinkSimulator::clear() { framebuffer.clear(config.background); }

void EinkSimulator::fill(const Color color) { framebuffer.clear(color); }

void EinkSimulator::drawPixel(const int x, const int y) { renderer.drawPixel(x, y, config.foreground); }

void EinkSimulator::drawPixel(const int x, const int y, const Color color) { renderer.drawPixel(x, y, color); }

void EinkSimulator::fillRect(const int x, const int y, const int w, const int h) {
  renderer.fillRect(x, y, w, h, config.foreground);
}

void EinkSimulator::fillRect(const int x, const int y, const int w, const int h, const Color color) {
  renderer.fillRect(x, y, w, h, color);
}

void EinkSimulator::drawText(const char* text, const int x, const int y) { drawText(text, x, y, textColor); }

void EinkSimulator::drawText(const char* text, const int x, const int y, const Color color) {
  renderer.drawText(text, x, y, currentFont, color);
}

void EinkSimulator::drawText(const char* text, const int x, const int y, const GfxFont& font) {
  renderer.drawText(text, x, y, font, textColor);
}

void EinkSimulator::drawText(const char* text, const int x, const int y, const GfxFont& font, const Color color) {
  renderer.drawText(text, x, y, font, color);
}

void EinkSimulator::drawTextCentered(const char* text, const int x, const int y, const int width) {
  drawTextCentered(text, x, y, width, textColor);
}

void EinkSimulator::drawTextCentered(const char* text, const int x, const int y, const int width, const Color color) {
  renderer.drawTextCentered(text, x, y, width, currentFont, color);
}

void EinkSimulator::drawTextCentered(const char* text, const int x, const int y, const int width,
                                     const GfxFont& font) {
  renderer.drawTextCentered(text, x, y, width, font, textColor);
}

void EinkSimulator::drawTextCentered(const char* text, const int x, const int y, const int width,
                                     const GfxFont& font, const Color color) {
  renderer.drawTextCentered(text, x, y, width, font, color);
}

void EinkSimulator::drawTextRightAligned(const char* text, const int rightX, const int y) {
  drawTextRightAligned(text, rightX, y, textColor);
}

void EinkSimulator::drawTextRightAligned(const char* text, const int rightX, const int y, const Color color) {
  renderer.drawTextRightAligned(text, rightX, y, currentFont, color);
}

void EinkSimulator::drawTextRightAligned(const char* text, const int rightX, const int y, const GfxFont& font) {
  renderer.drawTextRightAligned(text, rightX, y, font, textColor);
}

void EinkSimulator::drawTextRightAligned(const char* text, const int rightX, const int y, const GfxFont& font,
                                         const Color color) {
  renderer.drawTextRightAligned(text, rightX, y, font, color);
}

int EinkSimulator::getTextWidth(const char* text) const { return GfxRenderer::getTextWidth(text, currentFont); }

int EinkSimulator::getTextWidth(const char* text, const GfxFont& font) const { return font.getTextWidth(text); }

TextBounds EinkSimulator::getTextBounds(const char* text) const {
  return GfxRenderer::getTextBounds(text, currentFont);
}

TextBounds EinkSimulator::getTextBounds(const char* text, const GfxFont& font) const {
  return font.getTextBounds(text);
}

void EinkSimulator::drawXBitmap(const int x, const int y, const uint8_t* bitmap, const size_t size, const int w,
                                const int h) {
  renderer.drawPackedImage(x, y, bitmap, size, w, h, config.foreground);
}

void EinkSimulator::drawXBitmap(const int x, const int y, const uint8_t* bitmap, const size_t size, const int w,
                                const int h, const Color color) {
  renderer.drawPackedImage(x, y, bitmap, size, w, h, color);
}

void EinkSimulator::drawXBitmapScaled(const int x, const int y, const uint8_t* bitmap, const size_t size,
                                      const int srcW, const int srcH, const int destW, const int destH) {
  renderer.drawPackedImageScaled(x, y, bitmap, size, srcW, srcH, destW, destH, config.foreground);
}

void EinkSimulator::drawXBitmapScaled(const int x, const int y, const uint8_t* bitmap, const size_t size,
                                      const int srcW, const int srcH, const int destW, const int destH,
                                      const Color color) {
  renderer.drawPackedImageScaled(x, y, bitmap, size, srcW, srcH, destW, destH, color);
}
