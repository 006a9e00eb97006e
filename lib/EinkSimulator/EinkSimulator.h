#pragma once

#include <DisplayConfig.h>
#include <GfxFont.h>
#include <GfxRenderer.h>
#include <HalFramebuffer.h>

#include <cstddef>
#include <cstdint>

// A simulated panel: framebuffer, renderer and the current text settings.
//
// Text calls without an explicit font use the font set with setFont(); while
// that is null the built-in 5x7 font is used, which is positioned by its top
// edge instead of the baseline. Colour arguments default to the text colour
// for text and to the foreground colour for everything else.
class EinkSimulator {
 public:
  explicit EinkSimulator(const DisplayConfig& config = DisplayConfig());

  EinkSimulator(const EinkSimulator&) = delete;
  EinkSimulator& operator=(const EinkSimulator&) = delete;

  int width() const { return framebuffer.width(); }
  int height() const { return framebuffer.height(); }
  Color foreground() const { return config.foreground; }
  Color background() const { return config.background; }
  const DisplayConfig& getConfig() const { return config; }

  HalFramebuffer& getFramebuffer() { return framebuffer; }
  const HalFramebuffer& getFramebuffer() const { return framebuffer; }
  const GfxRenderer& getRenderer() const { return renderer; }

  void clear();
  void fill(Color color);

  void drawPixel(int x, int y);
  void drawPixel(int x, int y, Color color);
  void fillRect(int x, int y, int w, int h);
  void fillRect(int x, int y, int w, int h, Color color);

  // Text settings
  void setFont(const GfxFont* font) { currentFont = font; }
  const GfxFont* getFont() const { return currentFont; }
  void setTextColor(Color color) { textColor = color; }
  Color getTextColor() const { return textColor; }

  // Either override may be given alone; the other falls back to the current setting.
  void drawText(const char* text, int x, int y);
  void drawText(const char* text, int x, int y, Color color);
  void drawText(const char* text, int x, int y, const GfxFont& font);
  void drawText(const char* text, int x, int y, const GfxFont& font, Color color);
  void drawTextCentered(const char* text, int x, int y, int width);
  void drawTextCentered(const char* text, int x, int y, int width, Color color);
  void drawTextCentered(const char* text, int x, int y, int width, const GfxFont& font);
  void drawTextCentered(const char* text, int x, int y, int width, const GfxFont& font, Color color);
  void drawTextRightAligned(const char* text, int rightX, int y);
  void drawTextRightAligned(const char* text, int rightX, int y, Color color);
  void drawTextRightAligned(const char* text, int rightX, int y, const GfxFont& font);
  void drawTextRightAligned(const char* text, int rightX, int y, const GfxFont& font, Color color);

  int getTextWidth(const char* text) const;
  int getTextWidth(const char* text, const GfxFont& font) const;
  TextBounds getTextBounds(const char* text) const;
  TextBounds getTextBounds(const char* text, const GfxFont& font) const;

  // Images
  void drawXBitmap(int x, int y, const uint8_t* bitmap, size_t size, int w, int h);
  void drawXBitmap(int x, int y, const uint8_t* bitmap, size_t size, int w, int h, Color color);
  void drawXBitmapScaled(int x, int y, const uint8_t* bitmap, size_t size, int srcW, int srcH, int destW, int destH);
  void drawXBitmapScaled(int x, int y, const uint8_t* bitmap, size_t size, int srcW, int srcH, int destW, int destH,
                         Color color);

 private:
  DisplayConfig config;
  HalFramebuffer framebuffer;
  GfxRenderer renderer;
  const GfxFont* currentFont = nullptr;
  Color textColor;
};
