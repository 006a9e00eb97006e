#include "XBitmap.h"

bool XBitmap::isSet(const int col, const int row) const {
  if (data == nullptr || col < 0 || row < 0) {
    return false;
  }
  const size_t byteIndex = static_cast<size_t>(row) * rowStride() + col / 8;
  if (byteIndex >= size) {
    return false;
  }
  return (data[byteIndex] >> (col % 8)) & 1;
}

bool XBitmap::isComplete() const {
  if (width <= 0 || height <= 0) {
    return true;
  }
  return data != nullptr && static_cast<size_t>(rowStride()) * height <= size;
}
