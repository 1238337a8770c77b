#pragma once

#include "../catalog/loader.hpp"
#include "../core/logging.hpp"
#include "../hass/sensor.hpp"
#include "../mdb/extractor.hpp"

#include <string>

namespace paramdb
{

struct DeviceSettings
{
    std::string id;          // unique_id prefix
    std::string rootTopic;   // MQTT namespace of the itho-wifi add-on
    std::string statusSuffix;
    std::string lwtSuffix;
    std::string payloadAvailable;
    std::string payloadNotAvailable;
    std::string language{"GB"}; // NL, GB or D

    // Derived constants handed to the sensor synthesizer.
    hass::SensorConstants sensorConstants() const;
};

struct LogSettings
{
    log::Level level{log::Level::info};
    std::string path; // empty -> stderr only
};

struct Config
{
    DeviceSettings device;
    mdb::ToolConfig tools;
    catalog::LoaderOptions loader;

    // Optional device class table; empty -> built-in defaults.
    std::string deviceClassInfoPath;

    LogSettings logging;
};

// Built-in defaults (used when no config file is given).
Config defaultConfig();

// Load from file (JSON). Missing keys keep their defaults. Throws
// std::runtime_error on unreadable files, bad JSON or bad values.
Config loadConfigFromJsonFile(const std::string& jsonPath);

} // namespace paramdb
