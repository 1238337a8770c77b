#pragma once

#include <optional>
#include <string>

namespace paramdb::hass
{

struct NormalizedUnit
{
    // Spelling used inside this tool ("m3/h", "hour").
    std::string canonical;
    // Spelling shown to Home Assistant and matched against the device-class
    // tables ("m³/h", "h"). Empty for the "-" no-unit marker.
    std::optional<std::string> display;
};

// Fix the unit spellings found in Itho datalabel tables:
//   M3/h, m3/h, m³/h -> m3/h (display m³/h)
//   uur              -> hour (display h)
//   -                -> -    (no display unit)
// Everything else passes through unchanged. Idempotent on `canonical`.
NormalizedUnit normalizeUnit(const std::string& raw);

} // namespace paramdb::hass
