#include "reference.hpp"

#include "constants.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace j = nlohmann;

namespace paramdb::hass
{

ReferenceTable::ReferenceTable(std::vector<DeviceClassInfo> classes) :
    table(std::move(classes))
{}

ReferenceTable ReferenceTable::defaults()
{
    using namespace hassconst;
    const std::vector<std::string> measurement = {kStateMeasurement};

    return ReferenceTable({
        {"apparent_power", {"VA"}, measurement},
        {"carbon_dioxide", {"ppm"}, measurement},
        {"current", {"A", "mA"}, measurement},
        {"duration",
         {"d", "h", "min", "s", "ms"},
         {kStateMeasurement, kStateTotal, kStateTotalIncreasing}},
        {"energy",
         {"Wh", "kWh", "MWh", "MJ", "GJ"},
         {kStateTotal, kStateTotalIncreasing}},
        {"humidity", {"%"}, measurement},
        {"power", {"W", "kW"}, measurement},
        {"pressure",
         {"Pa", "hPa", "kPa", "bar", "cbar", "mbar", "mmHg", "inHg", "psi"},
         measurement},
        {"temperature", {"°C", "°F", "K"}, measurement},
        {"volume_flow_rate",
         {"m³/h", "ft³/min", "L/min", "gal/min"},
         measurement},
    });
}

ReferenceTable ReferenceTable::loadFromFile(const std::string& path)
{
    std::ifstream ifs(path);
    if (!ifs.good())
    {
        throw std::runtime_error("Cannot open device class file: " + path);
    }

    j::json root = j::json::parse(ifs, nullptr, /*allow_exceptions*/ false);
    if (!root.is_object() || !root.contains("deviceclasses") ||
        !root["deviceclasses"].is_array())
    {
        throw std::runtime_error("Missing deviceclasses array in " + path);
    }

    std::vector<DeviceClassInfo> classes;
    try
    {
        for (const auto& it : root["deviceclasses"])
        {
            DeviceClassInfo info;
            info.name = it.value("name", "");
            if (info.name.empty())
                continue;
            info.units = it.value("units", std::vector<std::string>{});
            info.stateClasses =
                it.value("stateclasses", std::vector<std::string>{});
            classes.push_back(std::move(info));
        }
    }
    catch (const j::json::exception& e)
    {
        throw std::runtime_error("Invalid device class file " + path + ": " +
                                 e.what());
    }
    return ReferenceTable(std::move(classes));
}

std::vector<std::string>
    ReferenceTable::classesForUnit(const std::string& unit) const
{
    std::vector<std::string> out;
    for (const auto& c : table)
    {
        if (std::find(c.units.begin(), c.units.end(), unit) != c.units.end())
            out.push_back(c.name);
    }
    return out;
}

const std::vector<std::string>&
    ReferenceTable::stateClasses(const std::string& deviceClass) const
{
    static const std::vector<std::string> none;
    for (const auto& c : table)
    {
        if (c.name == deviceClass)
            return c.stateClasses;
    }
    return none;
}

} // namespace paramdb::hass
