#include "JsonConfigIO.h"

#include <ArduinoJson.h>
#include <Logging.h>

#include <fstream>
#include <iterator>

namespace JsonConfigIO {

bool loadDisplayConfig(DisplayConfig& config, const char* json) {
  if (json == nullptr) {
    LOG_ERR("CFG", "No JSON to parse");
    return false;
  }

  JsonDocument doc;
  auto error = deserializeJson(doc, json);
  if (error) {
    LOG_ERR("CFG", "JSON parse error: %s", error.c_str());
    return false;
  }

  DisplayConfig loaded = config;
  loaded.width = doc["width"] | config.width;
  loaded.height = doc["height"] | config.height;
  if (loaded.width <= 0 || loaded.height <= 0) {
    LOG_ERR("CFG", "Invalid display size %dx%d", loaded.width, loaded.height);
    return false;
  }

  const char* foreground = doc["foreground"].as<const char*>();
  if (foreground && !parseColor(foreground, &loaded.foreground)) {
    LOG_ERR("CFG", "Invalid foreground colour: %s", foreground);
    return false;
  }
  const char* background = doc["background"].as<const char*>();
  if (background && !parseColor(background, &loaded.background)) {
    LOG_ERR("CFG", "Invalid background colour: %s", background);
    return false;
  }

  const char* levelName = doc["logLevel"].as<const char*>();
  LogLevel level = getLogLevel();
  if (levelName && !parseLogLevel(levelName, &level)) {
    LOG_ERR("CFG", "Unknown log level: %s", levelName);
    return false;
  }

  config = loaded;
  setLogLevel(level);
  LOG_INF("CFG", "Display %dx%d, fg %s, bg %s", config.width, config.height, formatColor(config.foreground).c_str(),
          formatColor(config.background).c_str());
  return true;
}

bool loadDisplayConfigFile(DisplayConfig& config, const char* path) {
  std::ifstream file(path);
  if (!file) {
    LOG_ERR("CFG", "Cannot open %s", path);
    return false;
  }
  const std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return loadDisplayConfig(config, json.c_str());
}

void saveDisplayConfig(const DisplayConfig& config, std::string& json) {
  JsonDocument doc;
  doc["width"] = config.width;
  doc["height"] = config.height;
  doc["foreground"] = formatColor(config.foreground);
  doc["background"] = formatColor(config.background);
  doc["logLevel"] = logLevelName(getLogLevel());

  json.clear();
  serializeJson(doc, json);
}

bool saveDisplayConfigFile(const DisplayConfig& config, const char* path) {
  std::string json;
  saveDisplayConfig(config, json);

  std::ofstream file(path);
  if (!file) {
    LOG_ERR("CFG", "Cannot write %s", path);
    return false;
  }
  file << json;
  return static_cast<bool>(file);
}

}  // namespace JsonConfigIO
