#pragma once

#include <cstdint>

// Classic 5x7 glcdfont, used when no external font is selected.
// Column-major: each glyph is 5 bytes, one per column, bit r = row r.
// Glyphs are positioned by their top-left corner, not a baseline.
namespace builtinfont {

constexpr uint8_t FIRST = 0x20;
constexpr uint8_t LAST = 0x7F;
constexpr int WIDTH = 5;
constexpr int HEIGHT = 7;
// Glyph width plus one column of spacing. Applies to every byte, printable or not.
constexpr int ADVANCE = 6;

/// 5 column bytes for `code`, or nullptr outside FIRST..LAST.
const uint8_t* glyph(uint8_t code);

}  // namespace builtinfont
