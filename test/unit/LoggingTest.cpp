#include <Logging.h>

#include <string>
#include <vector>

#include "test/test_harness.h"

static std::vector<std::string> g_lines;

static void captureSink(LogLevel, const char* line) { g_lines.push_back(line); }

static void resetCapture(const LogLevel level) {
  g_lines.clear();
  setLogSink(captureSink);
  setLogLevel(level);
}

void testLineFormat() {
  resetCapture(LogLevel::Debug);

  LOG_INF("GFX", "drew %d pixels", 12);
  LOG_ERR("CFG", "bad");
  LOG_DBG("SIM", "%s", "detail");

  ASSERT_EQ(g_lines.size(), 3u);
  ASSERT_STREQ(g_lines[0], "[INF] [GFX] drew 12 pixels");
  ASSERT_STREQ(g_lines[1], "[ERR] [CFG] bad");
  ASSERT_STREQ(g_lines[2], "[DBG] [SIM] detail");
}

void testThresholdFilters() {
  resetCapture(LogLevel::Error);

  LOG_DBG("GFX", "hidden");
  LOG_INF("GFX", "hidden");
  LOG_ERR("GFX", "shown");

  ASSERT_EQ(g_lines.size(), 1u);
  ASSERT_STREQ(g_lines[0], "[ERR] [GFX] shown");
}

void testNoneSilencesEverything() {
  resetCapture(LogLevel::None);

  LOG_ERR("GFX", "hidden");

  ASSERT_EQ(g_lines.size(), 0u);
}

void testLongMessageIsTruncated() {
  resetCapture(LogLevel::Info);

  const std::string longText(1000, 'x');
  LOG_INF("GFX", "%s", longText.c_str());

  ASSERT_EQ(g_lines.size(), 1u);
  ASSERT_TRUE(g_lines[0].size() < 300);
}

void testLevelNames() {
  LogLevel level = LogLevel::None;
  ASSERT_TRUE(parseLogLevel("debug", &level));
  ASSERT_TRUE(level == LogLevel::Debug);
  ASSERT_TRUE(parseLogLevel("error", &level));
  ASSERT_TRUE(level == LogLevel::Error);
  ASSERT_FALSE(parseLogLevel("DEBUG", &level));
  ASSERT_FALSE(parseLogLevel("verbose", &level));
  ASSERT_FALSE(parseLogLevel(nullptr, &level));
  ASSERT_TRUE(level == LogLevel::Error);

  const LogLevel all[] = {LogLevel::Debug, LogLevel::Info, LogLevel::Error, LogLevel::None};
  for (const LogLevel l : all) {
    LogLevel parsed = LogLevel::Info;
    ASSERT_TRUE(parseLogLevel(logLevelName(l), &parsed));
    ASSERT_TRUE(parsed == l);
  }
}

int main() {
  std::cout << "LoggingTest\n";
  RUN_TEST(testLineFormat);
  RUN_TEST(testThresholdFilters);
  RUN_TEST(testNoneSilencesEverything);
  RUN_TEST(testLongMessageIsTruncated);
  RUN_TEST(testLevelNames);
  setLogSink(nullptr);
  setLogLevel(LogLevel::Info);
  TEST_SUMMARY();
}
