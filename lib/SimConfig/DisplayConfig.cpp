#include "DisplayConfig.h"

#include <cstdio>
#include <cstring>

namespace {
int hexValue(const char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
}  // namespace

bool parseColor(const char* text, Color* out) {
  if (text == nullptr || text[0] != '#') {
    return false;
  }

  const size_t digits = strlen(text + 1);
  if (digits != 6 && digits != 3) {
    return false;
  }

  Color value = 0;
  for (size_t i = 1; i <= digits; i++) {
    const int v = hexValue(text[i]);
    if (v < 0) {
      return false;
    }
    // #RGB expands each digit to a full byte, e.g. #f80 -> #ff8800
    value = digits == 3 ? (value << 8) | static_cast<Color>(v * 0x11) : (value << 4) | static_cast<Color>(v);
  }

  *out = value;
  return true;
}

std::string formatColor(const Color color) {
  char buffer[8];
  snprintf(buffer, sizeof(buffer), "#%06X", static_cast<unsigned>(color & 0xFFFFFF));
  return buffer;
}
