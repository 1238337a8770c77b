#pragma once

#include "../buildjson/buildjson.hpp"
#include "../catalog/records.hpp"
#include "../hass/reference.hpp"
#include "../hass/sensor.hpp"
#include "../mdb/extractor.hpp"
#include "../store/sqlite_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace paramdb
{

// One conversion run over an Itho parameter file: extraction, the in-memory
// store, discovered versions and the per-version catalogs. The store and the
// working directory live exactly as long as this object.
class ParameterDatabase
{
  public:
    // Checks the tools and copies the input; see mdb::Extractor.
    ParameterDatabase(const std::string& parameterFile, const Config& cfg);
    ParameterDatabase(const std::string& parameterFile, const Config& cfg,
                      hass::ReferenceTable reference);

    // parse(), findVersions(), findParameters(), findDatalabels().
    void load();

    // Extract the Access file and rebuild it in the store.
    void parse();
    void findVersions();
    void findParameters();
    void findDatalabels();

    const std::vector<int>& versions() const
    {
        return vers;
    }
    const std::vector<std::string>& tables() const
    {
        return tableNames;
    }

    // Throw UnknownVersion for versions not in versions().
    const std::vector<catalog::Parameter>& parameters(int version) const;
    const std::vector<catalog::Datalabel>& datalabels(int version) const;
    std::vector<hass::SensorDescriptor> sensors(int version) const;

  private:
    void requireVersion(int version) const;

    Config cfg;
    hass::ReferenceTable reference;
    mdb::Extractor extractor;
    std::unique_ptr<store::Store> db;

    std::vector<std::string> tableNames;
    std::vector<int> vers;
    catalog::ParameterCatalog params;
    catalog::DatalabelCatalog labels;
};

// Reference table named by the config, or the built-in one.
hass::ReferenceTable referenceFromConfig(const Config& cfg);

} // namespace paramdb
