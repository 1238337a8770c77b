#include "assembler.hpp"

#include "../core/logging.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace paramdb::output
{

static Document localized(const catalog::LocalizedText& t,
                          const char* descriptionKey)
{
    Document j;
    j["text"] = t.text;
    j[descriptionKey] = t.description;
    j["unit"] = t.unit;
    return j;
}

Document toJson(const hass::SensorDescriptor& s)
{
    Document j;
    j["name"] = s.name;
    j["unique_id"] = s.uniqueId;
    j["state_topic"] = s.stateTopic;
    j["value_template"] = s.valueTemplate;
    if (s.unitOfMeasurement)
        j["unit_of_measurement"] = *s.unitOfMeasurement;
    if (s.deviceClass)
        j["device_class"] = *s.deviceClass;
    if (s.stateClass)
        j["state_class"] = *s.stateClass;
    Document availability;
    availability["topic"] = s.availabilityTopic;
    j["availability"].push_back(availability);
    j["payload_available"] = s.payloadAvailable;
    j["payload_not_available"] = s.payloadNotAvailable;
    return j;
}

Document toJson(const catalog::Parameter& p)
{
    Document j;
    j["index"] = p.index;
    j["order"] = p.order;
    j["name"] = p.name;
    j["factory_name"] = p.factoryName;
    j["min"] = p.min;
    j["max"] = p.max;
    j["default"] = p.defaultValue;
    j["NL"] = localized(p.nl, "description");
    j["GB"] = localized(p.gb, "description");
    j["D"] = localized(p.d, "description");
    j["subtable"] = p.subtable;
    j["password_level"] = p.passwordLevel;
    return j;
}

Document toJson(const catalog::Datalabel& d)
{
    Document j;
    j["index"] = d.index;
    j["name"] = d.name;
    j["NL"] = localized(d.nl, "tooltip");
    j["GB"] = localized(d.gb, "tooltip");
    j["D"] = localized(d.d, "tooltip");
    j["subtable"] = d.subtable;
    j["visible"] = d.visible;
    return j;
}

template <typename T>
static Document assembleAll(const std::vector<T>& items)
{
    Document arr = Document::array();
    for (const auto& it : items)
        arr.push_back(toJson(it));
    return arr;
}

Document assemble(const std::vector<hass::SensorDescriptor>& sensors)
{
    return assembleAll(sensors);
}

Document assemble(const std::vector<catalog::Parameter>& parameters)
{
    return assembleAll(parameters);
}

Document assemble(const std::vector<catalog::Datalabel>& datalabels)
{
    return assembleAll(datalabels);
}

std::string render(const Document& doc)
{
    // ensure_ascii=false keeps "m³/h" and "°C" as written. Invalid UTF-8
    // from the Access tables is replaced rather than aborting the dump.
    return doc.dump(2, ' ', false, Document::error_handler_t::replace);
}

void write(const Document& doc, const std::string& path)
{
    if (path.empty())
    {
        std::cout << render(doc) << "\n";
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(path).parent_path(), ec);
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.good())
    {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    ofs << render(doc) << "\n";
    log::info("Wrote " + std::to_string(doc.size()) + " entries to " + path);
}

} // namespace paramdb::output
