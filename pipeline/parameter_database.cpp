#include "parameter_database.hpp"

#include "../catalog/loader.hpp"
#include "../catalog/versions.hpp"
#include "../core/errors.hpp"
#include "../core/logging.hpp"

#include <algorithm>
#include <utility>

namespace paramdb
{

hass::ReferenceTable referenceFromConfig(const Config& cfg)
{
    if (cfg.deviceClassInfoPath.empty())
        return hass::ReferenceTable::defaults();
    return hass::ReferenceTable::loadFromFile(cfg.deviceClassInfoPath);
}

ParameterDatabase::ParameterDatabase(const std::string& parameterFile,
                                     const Config& cfg) :
    ParameterDatabase(parameterFile, cfg, referenceFromConfig(cfg))
{}

ParameterDatabase::ParameterDatabase(const std::string& parameterFile,
                                     const Config& cfg,
                                     hass::ReferenceTable reference) :
    cfg(cfg), reference(std::move(reference)),
    extractor(parameterFile, cfg.tools)
{}

void ParameterDatabase::load()
{
    parse();
    findVersions();
    findParameters();
    findDatalabels();
}

void ParameterDatabase::parse()
{
    auto ex = extractor.extract();

    // Only keep the store once it is fully loaded.
    auto fresh = std::make_unique<store::Store>();
    fresh->load(ex);

    db = std::move(fresh);
    tableNames = std::move(ex.tables);
    log::info("Imported " + std::to_string(tableNames.size()) + " tables");
}

void ParameterDatabase::findVersions()
{
    vers = catalog::findVersions(tableNames);
}

void ParameterDatabase::findParameters()
{
    if (!db)
        throw Error("Parameter file has not been parsed");

    catalog::CatalogLoader loader(*db, tableNames, cfg.loader);
    params = loader.loadParameters(vers);
}

void ParameterDatabase::findDatalabels()
{
    if (!db)
        throw Error("Parameter file has not been parsed");

    catalog::CatalogLoader loader(*db, tableNames, cfg.loader);
    labels = loader.loadDatalabels(vers);
}

void ParameterDatabase::requireVersion(int version) const
{
    if (std::find(vers.begin(), vers.end(), version) == vers.end())
        throw UnknownVersion(version);
}

const std::vector<catalog::Parameter>&
    ParameterDatabase::parameters(int version) const
{
    static const std::vector<catalog::Parameter> none;
    requireVersion(version);
    auto it = params.find(version);
    return it == params.end() ? none : it->second;
}

const std::vector<catalog::Datalabel>&
    ParameterDatabase::datalabels(int version) const
{
    static const std::vector<catalog::Datalabel> none;
    requireVersion(version);
    auto it = labels.find(version);
    return it == labels.end() ? none : it->second;
}

std::vector<hass::SensorDescriptor> ParameterDatabase::sensors(int version) const
{
    const auto consts = cfg.device.sensorConstants();

    std::vector<hass::SensorDescriptor> out;
    for (const auto& d : datalabels(version))
    {
        out.push_back(hass::makeSensor(d, consts, reference));
    }
    return out;
}

} // namespace paramdb
