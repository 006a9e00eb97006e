#pragma once

#include <string>

#include "DisplayConfig.h"

// JSON persistence for DisplayConfig:
//   {"width": 296, "height": 128, "foreground": "#000000", "background": "#FFFFFF", "logLevel": "info"}
// Missing keys keep the value already in the config.
namespace JsonConfigIO {

// Returns false and leaves `config` unchanged if the document is invalid.
bool loadDisplayConfig(DisplayConfig& config, const char* json);
bool loadDisplayConfigFile(DisplayConfig& config, const char* path);

void saveDisplayConfig(const DisplayConfig& config, std::string& json);
bool saveDisplayConfigFile(const DisplayConfig& config, const char* path);

}  // namespace JsonConfigIO
