#pragma once

#include "../store/sqlite_store.hpp"
#include "records.hpp"

#include <optional>
#include <string>
#include <vector>

namespace paramdb::catalog
{

struct LoaderOptions
{
    // A version without its own table reuses the table resolved for the
    // previous version. When false such a version gets an empty catalog.
    bool carryOverMissingTables{true};
};

// Reads Parameterlijst_V<n> / Datalabel_V<n> tables into typed records.
// Columns are mapped explicitly; a missing or unexpected column is a
// SchemaMismatch.
class CatalogLoader
{
  public:
    CatalogLoader(const store::Store& db, std::vector<std::string> tables,
                  LoaderOptions opts = {});

    // "Parameterlijst_V<n>", else "parameterlijst_V<n>".
    std::optional<std::string> parameterTable(int version) const;

    // "Datalabel_V<n>" only.
    std::optional<std::string> datalabelTable(int version) const;

    ParameterCatalog loadParameters(const std::vector<int>& versions) const;
    DatalabelCatalog loadDatalabels(const std::vector<int>& versions) const;

    // Single table, ordered by Index. Throws QueryError / SchemaMismatch.
    std::vector<Parameter> readParameters(const std::string& table) const;
    std::vector<Datalabel> readDatalabels(const std::string& table) const;

  private:
    bool hasTable(const std::string& name) const;

    const store::Store& db;
    std::vector<std::string> tables;
    LoaderOptions opts;
};

} // namespace paramdb::catalog
