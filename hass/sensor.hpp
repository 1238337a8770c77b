#pragma once

#include "../catalog/records.hpp"
#include "reference.hpp"

#include <optional>
#include <string>

namespace paramdb::hass
{

// Per-device values shared by every descriptor.
struct SensorConstants
{
    std::string deviceId;
    std::string stateTopic;        // <root>/<status suffix>
    std::string availabilityTopic; // <root>/<lwt suffix>
    std::string payloadAvailable;
    std::string payloadNotAvailable;
    catalog::Language language{catalog::Language::GB};

    // itho_432432 on itho_wtw/ithostatus, availability itho_wtw/lwt.
    static SensorConstants defaults();
};

// Home Assistant MQTT discovery config for one datalabel.
struct SensorDescriptor
{
    std::string name;
    std::string uniqueId;
    std::string stateTopic;
    std::string valueTemplate;
    std::optional<std::string> unitOfMeasurement; // display spelling
    std::optional<std::string> deviceClass;
    std::optional<std::string> stateClass;
    std::string availabilityTopic;
    std::string payloadAvailable;
    std::string payloadNotAvailable;

    std::string rawUnit;       // as found in the table
    std::string canonicalUnit; // after normalizeUnit()
};

// Device class listing `unit`; nullopt when none does. Throws
// AmbiguousClassification when more than one does.
std::optional<std::string> inferDeviceClass(const std::string& unit,
                                            const ReferenceTable& ref);

// {{ value_json["<label> (<unit>)"] }}
std::string valueTemplate(const std::string& label, const std::string& unit);

// Build the descriptor for one datalabel. Pure: no state is kept between
// calls.
SensorDescriptor makeSensor(const catalog::Datalabel& label,
                            const SensorConstants& consts,
                            const ReferenceTable& ref);

} // namespace paramdb::hass
