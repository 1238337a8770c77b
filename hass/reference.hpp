#pragma once

#include <string>
#include <vector>

namespace paramdb::hass
{

// Home Assistant's view of one sensor device class.
struct DeviceClassInfo
{
    std::string name;                      // e.g. "temperature"
    std::vector<std::string> units;        // recognized units_of_measurement
    std::vector<std::string> stateClasses; // recognized, in preference order
};

// Device class / unit / state class reference tables for the subset of
// device classes this tool assigns. Injected into the sensor synthesizer.
class ReferenceTable
{
  public:
    explicit ReferenceTable(std::vector<DeviceClassInfo> classes);

    // apparent_power, carbon_dioxide, current, duration, energy, humidity,
    // power, pressure, temperature, volume_flow_rate.
    static ReferenceTable defaults();

    // {"deviceclasses": [{"name": .., "units": [..], "stateclasses": [..]}]}
    // Throws std::runtime_error if the file is missing or malformed.
    static ReferenceTable loadFromFile(const std::string& path);

    // Every class listing `unit`, in table order.
    std::vector<std::string> classesForUnit(const std::string& unit) const;

    // Recognized state classes of a device class; empty if unknown.
    const std::vector<std::string>&
        stateClasses(const std::string& deviceClass) const;

    const std::vector<DeviceClassInfo>& classes() const
    {
        return table;
    }

  private:
    std::vector<DeviceClassInfo> table;
};

} // namespace paramdb::hass
