#pragma once

#include "../catalog/records.hpp"
#include "../hass/sensor.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace paramdb::output
{

// Keeps keys in insertion order.
using Document = nlohmann::ordered_json;

// name, unique_id, state_topic, value_template, [unit_of_measurement],
// [device_class], [state_class], availability, payload_available,
// payload_not_available.
Document toJson(const hass::SensorDescriptor& s);
Document toJson(const catalog::Parameter& p);
Document toJson(const catalog::Datalabel& d);

Document assemble(const std::vector<hass::SensorDescriptor>& sensors);
Document assemble(const std::vector<catalog::Parameter>& parameters);
Document assemble(const std::vector<catalog::Datalabel>& datalabels);

// Indented, non-ASCII characters kept verbatim.
std::string render(const Document& doc);

// Write render(doc) to a file, or stdout when path is empty.
void write(const Document& doc, const std::string& path);

} // namespace paramdb::output
