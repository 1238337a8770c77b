#include "sensor.hpp"

#include "../core/errors.hpp"
#include "constants.hpp"
#include "units.hpp"

namespace paramdb::hass
{

SensorConstants SensorConstants::defaults()
{
    using namespace hassconst;
    const std::string root = kRootTopic;

    SensorConstants c;
    c.deviceId = kDeviceId;
    c.stateTopic = root + "/" + kStatusSuffix;
    c.availabilityTopic = root + "/" + kLwtSuffix;
    c.payloadAvailable = kPayloadAvailable;
    c.payloadNotAvailable = kPayloadNotAvailable;
    return c;
}

std::optional<std::string> inferDeviceClass(const std::string& unit,
                                            const ReferenceTable& ref)
{
    auto classes = ref.classesForUnit(unit);
    if (classes.empty())
        return std::nullopt;
    if (classes.size() == 1)
        return classes.front();

    std::string list;
    for (const auto& c : classes)
        list += (list.empty() ? "" : ", ") + c;
    throw AmbiguousClassification("Multiple device classes found for unit '" +
                                  unit + "': " + list);
}

std::string valueTemplate(const std::string& label, const std::string& unit)
{
    std::string key = label + " (" + unit + ")";

    std::string quoted;
    for (char c : key)
    {
        if (c == '"' || c == '\\')
            quoted += '\\';
        quoted += c;
    }
    return "{{ value_json[\"" + quoted + "\"] }}";
}

SensorDescriptor makeSensor(const catalog::Datalabel& label,
                            const SensorConstants& consts,
                            const ReferenceTable& ref)
{
    const auto& text = label.text(consts.language);

    SensorDescriptor s;
    s.name = text.text;
    s.uniqueId = consts.deviceId + hassconst::kUniqueIdSeparator + text.text;
    s.stateTopic = consts.stateTopic;
    s.availabilityTopic = consts.availabilityTopic;
    s.payloadAvailable = consts.payloadAvailable;
    s.payloadNotAvailable = consts.payloadNotAvailable;
    s.rawUnit = text.unit;

    if (!text.unit.empty())
    {
        auto unit = normalizeUnit(text.unit);
        s.canonicalUnit = unit.canonical;
        s.unitOfMeasurement = unit.display;

        if (unit.display)
        {
            try
            {
                s.deviceClass = inferDeviceClass(*unit.display, ref);
            }
            catch (const AmbiguousClassification& e)
            {
                throw AmbiguousClassification(
                    "Datalabel " + std::to_string(label.index) + " (" +
                    text.text + "): " + e.what());
            }
        }
    }

    if (s.deviceClass)
    {
        const auto& states = ref.stateClasses(*s.deviceClass);
        if (!states.empty())
            s.stateClass = states.front();
    }

    // The itho-wifi status payload is keyed by the table's own label and
    // unit spelling ("Supply temp (°C)", "Airflow (M3/h)"). Use the raw unit
    // here, never the normalized one, or the template stops matching.
    s.valueTemplate = valueTemplate(text.description, text.unit);
    return s;
}

} // namespace paramdb::hass
