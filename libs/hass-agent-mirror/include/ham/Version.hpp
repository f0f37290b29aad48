#pragma once
#include <cstdint>

namespace ham {

constexpr uint16_t LIBRARY_MAJOR = 0;
constexpr uint16_t LIBRARY_MINOR = 4;

constexpr int AVAILABILITY_WINDOW_MS = 5000;
constexpr uint8_t SUBSCRIBE_QOS = 0;
constexpr uint8_t PUBLISH_QOS = 0;

constexpr const char* TOPIC_ROOT = "hass.agent/media_player";
constexpr const char* DEFAULT_MEDIA_TITLE = "Home Assistant";

} // namespace ham
