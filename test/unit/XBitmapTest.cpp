#include <GfxRenderer.h>
#include <HalFramebuffer.h>
#include <XBitmap.h>

#include <climits>

#include "test/stubs/RecordingSurface.h"
#include "test/test_harness.h"

// ===== Bit order =====

void testLsbIsLeftmostPixel() {
  const uint8_t data[] = {0x01};
  RecordingSurface surface;
  GfxRenderer renderer(surface);

  renderer.drawPackedImage(5, 7, data, sizeof(data), 8, 1, COLOR_BLACK);

  ASSERT_EQ(surface.writeCount(), 1u);
  ASSERT_TRUE(surface.has(5, 7));
}

void testMsbIsRightmostPixel() {
  const uint8_t data[] = {0x80};
  RecordingSurface surface;
  GfxRenderer renderer(surface);

  renderer.drawPackedImage(0, 0, data, sizeof(data), 8, 1, COLOR_BLACK);

  ASSERT_EQ(surface.writeCount(), 1u);
  ASSERT_TRUE(surface.has(7, 0));
}

void testRowsArePaddedToWholeBytes() {
  // 10 px wide: 2 bytes per row, the top 6 bits of each second byte are padding
  const XBitmap image(nullptr, 0, 10, 3);
  ASSERT_EQ(image.rowStride(), 2);
  ASSERT_EQ(XBitmap(nullptr, 0, 8, 1).rowStride(), 1);
  ASSERT_EQ(XBitmap(nullptr, 0, 1, 1).rowStride(), 1);
  ASSERT_EQ(XBitmap(nullptr, 0, 16, 1).rowStride(), 2);

  const uint8_t data[] = {0x00, 0x02, 0x01, 0xFC};
  RecordingSurface surface;
  GfxRenderer renderer(surface);

  renderer.drawPackedImage(0, 0, data, sizeof(data), 10, 2, COLOR_BLACK);

  ASSERT_EQ(surface.writeCount(), 2u);
  ASSERT_TRUE(surface.has(9, 0));
  ASSERT_TRUE(surface.has(0, 1));
}

void testIsSetBounds() {
  const uint8_t data[] = {0xFF};
  const XBitmap image(data, sizeof(data), 8, 2);

  ASSERT_TRUE(image.isSet(0, 0));
  ASSERT_TRUE(image.isSet(7, 0));
  ASSERT_FALSE(image.isSet(-1, 0));
  ASSERT_FALSE(image.isSet(0, -1));
  // second row is past the end of the data
  ASSERT_FALSE(image.isSet(0, 1));
  ASSERT_FALSE(image.isComplete());
  ASSERT_TRUE(XBitmap(data, sizeof(data), 8, 1).isComplete());
}

// ===== Transparency =====

void testUnsetBitsAreTransparent() {
  HalFramebuffer framebuffer(8, 2, 0x123456);
  GfxRenderer renderer(framebuffer);
  const uint8_t data[] = {0x81, 0x00};

  renderer.drawPackedImage(0, 0, data, sizeof(data), 8, 2, COLOR_BLACK);

  ASSERT_EQ(framebuffer.getPixel(0, 0), COLOR_BLACK);
  ASSERT_EQ(framebuffer.getPixel(7, 0), COLOR_BLACK);
  ASSERT_EQ(framebuffer.getPixel(1, 0), 0x123456u);
  ASSERT_EQ(framebuffer.countPixels(0x123456), 14u);
}

void testShortBufferDoesNotCrash() {
  const uint8_t data[] = {0xFF};
  RecordingSurface surface;
  GfxRenderer renderer(surface);

  renderer.drawPackedImage(0, 0, data, sizeof(data), 8, 4, COLOR_BLACK);
  renderer.drawPackedImage(0, 0, nullptr, 0, 8, 4, COLOR_BLACK);

  ASSERT_EQ(surface.writeCount(), 8u);
}

// ===== Scaling =====

void testScaleOneMatchesUnscaled() {
  const uint8_t data[] = {0x5A, 0x03, 0xC3, 0x01, 0x18, 0x02};
  RecordingSurface plain;
  RecordingSurface scaled;

  GfxRenderer(plain).drawPackedImage(3, 4, data, sizeof(data), 10, 3, COLOR_BLACK);
  GfxRenderer(scaled).drawPackedImageScaled(3, 4, data, sizeof(data), 10, 3, 10, 3, COLOR_BLACK);

  ASSERT_TRUE(plain.writeCount() > 0);
  ASSERT_TRUE(plain.pixelSet() == scaled.pixelSet());
}

void testDoubleSizeReplicatesPixels() {
  // 2x2 checkerboard: (0,0) and (1,1) set
  const uint8_t data[] = {0x01, 0x02};
  RecordingSurface surface;
  GfxRenderer renderer(surface);

  renderer.drawPackedImageScaled(0, 0, data, sizeof(data), 2, 2, 4, 4, COLOR_BLACK);

  ASSERT_EQ(surface.writeCount(), 8u);
  ASSERT_TRUE(surface.has(0, 0));
  ASSERT_TRUE(surface.has(1, 1));
  ASSERT_TRUE(surface.has(2, 2));
  ASSERT_TRUE(surface.has(3, 3));
  ASSERT_FALSE(surface.has(2, 0));
  ASSERT_FALSE(surface.has(0, 2));
}

void testDownscaleSamplesFloor() {
  // 4x1 image with only column 2 set, scaled to 2x1: dest 1 samples src floor(1*4/2) = 2
  const uint8_t data[] = {0x04};
  RecordingSurface surface;
  GfxRenderer renderer(surface);

  renderer.drawPackedImageScaled(0, 0, data, sizeof(data), 4, 1, 2, 1, COLOR_BLACK);

  ASSERT_EQ(surface.writeCount(), 1u);
  ASSERT_TRUE(surface.has(1, 0));
}

void testUnevenScaleFloorsSourceColumn() {
  // 3 px to 7 px: dest columns map to 0 0 0 1 1 2 2
  const uint8_t data[] = {0x02};
  RecordingSurface surface;
  GfxRenderer renderer(surface);

  renderer.drawPackedImageScaled(0, 0, data, sizeof(data), 3, 1, 7, 1, COLOR_BLACK);

  ASSERT_EQ(surface.writeCount(), 2u);
  ASSERT_TRUE(surface.has(3, 0));
  ASSERT_TRUE(surface.has(4, 0));
}

void testScaleRatioIsRoundedBeforeMultiplying() {
  // 2 px to 98 px: 49 * (2.0 / 98) lands just below 1.0 in double, so dest 49
  // still samples source column 0 and only dest 50..97 pick up column 1
  const uint8_t data[] = {0x02};
  RecordingSurface surface;
  GfxRenderer renderer(surface);

  renderer.drawPackedImageScaled(0, 0, data, sizeof(data), 2, 1, 98, 1, COLOR_BLACK);

  ASSERT_FALSE(surface.has(49, 0));
  ASSERT_TRUE(surface.has(50, 0));
  ASSERT_TRUE(surface.has(97, 0));
  ASSERT_EQ(surface.writeCount(), 48u);
}

void testHugeWidthStride() {
  ASSERT_EQ(XBitmap(nullptr, 0, INT_MAX, 1).rowStride(), 268435456);
  ASSERT_EQ(XBitmap(nullptr, 0, INT_MAX - 3, 1).rowStride(), 268435456);
}

void testZeroDestinationDrawsNothing() {
  const uint8_t data[] = {0xFF, 0xFF};
  RecordingSurface surface;
  GfxRenderer renderer(surface);

  renderer.drawPackedImageScaled(0, 0, data, sizeof(data), 8, 2, 0, 4, COLOR_BLACK);
  renderer.drawPackedImageScaled(0, 0, data, sizeof(data), 8, 2, 4, 0, COLOR_BLACK);
  renderer.drawPackedImageScaled(0, 0, data, sizeof(data), 8, 2, -3, 4, COLOR_BLACK);

  ASSERT_EQ(surface.writeCount(), 0u);
}

int main() {
  std::cout << "XBitmapTest\n";
  RUN_TEST(testLsbIsLeftmostPixel);
  RUN_TEST(testMsbIsRightmostPixel);
  RUN_TEST(testRowsArePaddedToWholeBytes);
  RUN_TEST(testIsSetBounds);
  RUN_TEST(testUnsetBitsAreTransparent);
  RUN_TEST(testShortBufferDoesNotCrash);
  RUN_TEST(testScaleOneMatchesUnscaled);
  RUN_TEST(testDoubleSizeReplicatesPixels);
  RUN_TEST(testDownscaleSamplesFloor);
  RUN_TEST(testUnevenScaleFloorsSourceColumn);
  RUN_TEST(testScaleRatioIsRoundedBeforeMultiplying);
  RUN_TEST(testHugeWidthStride);
  RUN_TEST(testZeroDestinationDrawsNothing);
  TEST_SUMMARY();
}
