#include "buildjson.hpp"

#include "../hass/constants.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace j = nlohmann;

namespace paramdb
{

// One day; a tool that needs longer is hung.
static constexpr int kMaxToolTimeoutSec = 24 * 60 * 60;

static std::string read_string(const j::json& obj, const char* key,
                               const std::string& def)
{
    auto it = obj.find(key);
    return (it == obj.end()) ? def : it->get<std::string>();
}

static int read_int(const j::json& obj, const char* key, int def = 0)
{
    auto it = obj.find(key);
    return (it == obj.end()) ? def : it->get<int>();
}

static bool read_bool(const j::json& obj, const char* key, bool def)
{
    auto it = obj.find(key);
    return (it == obj.end()) ? def : it->get<bool>();
}

hass::SensorConstants DeviceSettings::sensorConstants() const
{
    hass::SensorConstants c;
    c.deviceId = id;
    c.stateTopic = rootTopic + "/" + statusSuffix;
    c.availabilityTopic = rootTopic + "/" + lwtSuffix;
    c.payloadAvailable = payloadAvailable;
    c.payloadNotAvailable = payloadNotAvailable;
    c.language = catalog::parseLanguage(language);
    return c;
}

Config defaultConfig()
{
    Config out{};
    out.device.id = hassconst::kDeviceId;
    out.device.rootTopic = hassconst::kRootTopic;
    out.device.statusSuffix = hassconst::kStatusSuffix;
    out.device.lwtSuffix = hassconst::kLwtSuffix;
    out.device.payloadAvailable = hassconst::kPayloadAvailable;
    out.device.payloadNotAvailable = hassconst::kPayloadNotAvailable;
    return out;
}

Config loadConfigFromJsonFile(const std::string& jsonPath)
{
    std::ifstream ifs(jsonPath);
    if (!ifs.good())
    {
        throw std::runtime_error("Cannot open config file: " + jsonPath);
    }

    Config out = defaultConfig();

    try
    {
        j::json root = j::json::parse(ifs);
        if (!root.is_object())
        {
            throw std::runtime_error("Config root must be an object");
        }

        // ===== device identity and topics =====
        if (root.contains("device"))
        {
            const auto& d = root.at("device");
            auto& dev = out.device;
            dev.id = read_string(d, "id", dev.id);
            dev.rootTopic = read_string(d, "roottopic", dev.rootTopic);
            dev.statusSuffix = read_string(d, "statussuffix", dev.statusSuffix);
            dev.lwtSuffix = read_string(d, "lwtsuffix", dev.lwtSuffix);
            dev.payloadAvailable =
                read_string(d, "payloadavailable", dev.payloadAvailable);
            dev.payloadNotAvailable =
                read_string(d, "payloadnotavailable", dev.payloadNotAvailable);
            dev.language = read_string(d, "language", dev.language);
        }

        // ===== mdbtools =====
        if (root.contains("tools"))
        {
            const auto& t = root.at("tools");
            out.tools.schemaTool =
                read_string(t, "mdbschema", out.tools.schemaTool);
            out.tools.tablesTool =
                read_string(t, "mdbtables", out.tools.tablesTool);
            out.tools.exportTool =
                read_string(t, "mdbexport", out.tools.exportTool);
            out.tools.timeout = std::chrono::seconds(read_int(
                t, "timeoutsec",
                static_cast<int>(out.tools.timeout.count())));
        }

        // ===== catalog loader =====
        if (root.contains("loader"))
        {
            out.loader.carryOverMissingTables =
                read_bool(root.at("loader"), "carryovermissingtables",
                          out.loader.carryOverMissingTables);
        }

        out.deviceClassInfoPath =
            read_string(root, "deviceclassinfopath", std::string{});

        // ===== logging =====
        if (root.contains("log"))
        {
            const auto& l = root.at("log");
            if (l.contains("level"))
                out.logging.level =
                    log::parseLevel(l.at("level").get<std::string>());
            out.logging.path = read_string(l, "path", out.logging.path);
        }
    }
    catch (const j::json::exception& e)
    {
        throw std::runtime_error("Invalid config file " + jsonPath + ": " +
                                 e.what());
    }

    // ===== validation =====
    (void)catalog::parseLanguage(out.device.language);
    if (out.device.id.empty() || out.device.rootTopic.empty())
    {
        throw std::runtime_error(
            "Invalid device settings in " + jsonPath +
            ": require a non-empty 'id' and 'roottopic'.");
    }
    if (out.tools.timeout.count() < 0 ||
        out.tools.timeout.count() > kMaxToolTimeoutSec)
    {
        throw std::runtime_error("Invalid tools.timeoutsec in " + jsonPath +
                                 ": expected 0.." +
                                 std::to_string(kMaxToolTimeoutSec));
    }

    return out;
}

} // namespace paramdb
