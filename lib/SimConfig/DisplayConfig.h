#pragma once

#include <PixelSurface.h>

#include <string>

// Panel geometry and ink colours. Defaults match a 2.9" 296x128 e-paper panel.
struct DisplayConfig {
  int width = 296;
  int height = 128;
  Color foreground = COLOR_BLACK;
  Color background = COLOR_WHITE;
};

// Accepts "#RRGGBB" and "#RGB" (case-insensitive). Leaves `out` untouched on failure.
bool parseColor(const char* text, Color* out);
std::string formatColor(Color color);
