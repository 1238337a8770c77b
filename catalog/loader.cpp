#include "loader.hpp"

#include "../core/errors.hpp"
#include "../core/logging.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace paramdb::catalog
{

namespace
{

template <typename Record>
struct Column
{
    const char* name;
    void (*assign)(Record&, const store::Row&, int);
};

// Column set of Parameterlijst_V<n>.
const std::vector<Column<Parameter>>& parameterColumns()
{
    using R = store::Row;
    static const std::vector<Column<Parameter>> cols = {
        {"Index", [](Parameter& p, const R& r, int i) { p.index = r.getInt(i); }},
        {"Volgorde", [](Parameter& p, const R& r, int i) { p.order = r.getInt(i); }},
        {"Naam", [](Parameter& p, const R& r, int i) { p.name = r.getText(i); }},
        {"Naam_fabriek",
         [](Parameter& p, const R& r, int i) { p.factoryName = r.getText(i); }},
        {"Min", [](Parameter& p, const R& r, int i) { p.min = r.getDouble(i); }},
        {"Max", [](Parameter& p, const R& r, int i) { p.max = r.getDouble(i); }},
        {"Default",
         [](Parameter& p, const R& r, int i) { p.defaultValue = r.getDouble(i); }},
        {"Tekst_NL", [](Parameter& p, const R& r, int i) { p.nl.text = r.getText(i); }},
        {"Omschrijving_NL",
         [](Parameter& p, const R& r, int i) { p.nl.description = r.getText(i); }},
        {"Eenheid_NL", [](Parameter& p, const R& r, int i) { p.nl.unit = r.getText(i); }},
        {"Tekst_GB", [](Parameter& p, const R& r, int i) { p.gb.text = r.getText(i); }},
        {"Omschrijving_GB",
         [](Parameter& p, const R& r, int i) { p.gb.description = r.getText(i); }},
        {"Eenheid_GB", [](Parameter& p, const R& r, int i) { p.gb.unit = r.getText(i); }},
        {"Tekst_D", [](Parameter& p, const R& r, int i) { p.d.text = r.getText(i); }},
        {"Omschrijving_D",
         [](Parameter& p, const R& r, int i) { p.d.description = r.getText(i); }},
        {"Eenheid_D", [](Parameter& p, const R& r, int i) { p.d.unit = r.getText(i); }},
        {"Subtabel", [](Parameter& p, const R& r, int i) { p.subtable = r.getText(i); }},
        {"Paswoordnivo",
         [](Parameter& p, const R& r, int i) { p.passwordLevel = r.getInt(i); }},
    };
    return cols;
}

// Column set of Datalabel_V<n>.
const std::vector<Column<Datalabel>>& datalabelColumns()
{
    using R = store::Row;
    static const std::vector<Column<Datalabel>> cols = {
        {"Index", [](Datalabel& d, const R& r, int i) { d.index = r.getInt(i); }},
        {"Naam", [](Datalabel& d, const R& r, int i) { d.name = r.getText(i); }},
        {"Tekst_NL", [](Datalabel& d, const R& r, int i) { d.nl.text = r.getText(i); }},
        {"Tooltip_NL",
         [](Datalabel& d, const R& r, int i) { d.nl.description = r.getText(i); }},
        {"Eenheid_NL", [](Datalabel& d, const R& r, int i) { d.nl.unit = r.getText(i); }},
        {"Tekst_GB", [](Datalabel& d, const R& r, int i) { d.gb.text = r.getText(i); }},
        {"Tooltip_GB",
         [](Datalabel& d, const R& r, int i) { d.gb.description = r.getText(i); }},
        {"Eenheid_GB", [](Datalabel& d, const R& r, int i) { d.gb.unit = r.getText(i); }},
        {"Tekst_D", [](Datalabel& d, const R& r, int i) { d.d.text = r.getText(i); }},
        {"Tooltip_D",
         [](Datalabel& d, const R& r, int i) { d.d.description = r.getText(i); }},
        {"Eenheid_D", [](Datalabel& d, const R& r, int i) { d.d.unit = r.getText(i); }},
        {"SubTabel", [](Datalabel& d, const R& r, int i) { d.subtable = r.getText(i); }},
        {"Visible",
         [](Datalabel& d, const R& r, int i) { d.visible = r.getInt(i) != 0; }},
    };
    return cols;
}

template <typename Record>
std::vector<Record> readTable(const store::Store& db, const std::string& table,
                              const std::vector<Column<Record>>& columns)
{
    // Position of each result column in `columns`.
    std::vector<size_t> slot;
    int indexColumn = -1;

    auto header = [&](const std::vector<std::string>& names) {
        std::set<std::string> seen;
        for (const auto& n : names)
        {
            auto it = std::find_if(columns.begin(), columns.end(),
                                   [&](const auto& c) { return n == c.name; });
            if (it == columns.end())
            {
                throw SchemaMismatch("Table " + table +
                                     " has unexpected column: " + n);
            }
            if (!seen.insert(n).second)
            {
                throw SchemaMismatch("Table " + table +
                                     " repeats column: " + n);
            }
            if (n == "Index")
                indexColumn = static_cast<int>(slot.size());
            slot.push_back(static_cast<size_t>(it - columns.begin()));
        }
        for (const auto& c : columns)
        {
            if (!seen.count(c.name))
            {
                throw SchemaMismatch("Table " + table +
                                     " is missing column: " + c.name);
            }
        }
    };

    std::vector<Record> out;
    auto visit = [&](const store::Row& row) {
        if (row.isNull(indexColumn))
        {
            throw SchemaMismatch("Table " + table + " has a row without Index");
        }

        Record rec{};
        for (size_t i = 0; i < slot.size(); ++i)
        {
            columns[slot[i]].assign(rec, row, static_cast<int>(i));
        }

        if (!out.empty() && out.back().index == rec.index)
        {
            throw SchemaMismatch("Table " + table + " repeats Index " +
                                 std::to_string(rec.index));
        }
        out.push_back(std::move(rec));
    };

    db.selectOrderedByIndex(table, header, visit);
    return out;
}

// Walk the versions resolving one table per version, honoring carry-over.
template <typename Catalog, typename Resolve, typename Read>
Catalog loadCatalog(const char* kind, const std::vector<int>& versions,
                    bool carryOver, Resolve resolve, Read read)
{
    Catalog out;
    std::string current;

    for (int v : versions)
    {
        log::debug(std::string("Finding ") + kind + " for version " +
                   std::to_string(v));

        if (auto t = resolve(v))
        {
            current = *t;
        }
        else if (!carryOver)
        {
            log::debug(std::string("No ") + kind + " table for version " +
                       std::to_string(v));
            out[v] = {};
            continue;
        }
        else if (current.empty())
        {
            throw QueryError(std::string("No ") + kind +
                             " table for version " + std::to_string(v) +
                             " and no earlier table to carry over");
        }
        else
        {
            log::warning(std::string("No ") + kind + " table for version " +
                         std::to_string(v) + ", reusing " + current);
        }

        log::debug("Using table: " + current);
        try
        {
            out[v] = read(current);
        }
        catch (const QueryError& e)
        {
            throw QueryError("Version " + std::to_string(v) + ": " + e.what());
        }
        catch (const SchemaMismatch& e)
        {
            throw SchemaMismatch("Version " + std::to_string(v) + ": " +
                                 e.what());
        }
    }
    return out;
}

} // namespace

CatalogLoader::CatalogLoader(const store::Store& db,
                             std::vector<std::string> tables,
                             LoaderOptions opts) :
    db(db), tables(std::move(tables)), opts(opts)
{}

bool CatalogLoader::hasTable(const std::string& name) const
{
    return std::find(tables.begin(), tables.end(), name) != tables.end();
}

std::optional<std::string> CatalogLoader::parameterTable(int version) const
{
    const std::string v = std::to_string(version);
    for (const auto& name : {"Parameterlijst_V" + v, "parameterlijst_V" + v})
    {
        if (hasTable(name))
            return name;
    }
    return std::nullopt;
}

std::optional<std::string> CatalogLoader::datalabelTable(int version) const
{
    const std::string name = "Datalabel_V" + std::to_string(version);
    if (hasTable(name))
        return name;
    return std::nullopt;
}

std::vector<Parameter>
    CatalogLoader::readParameters(const std::string& table) const
{
    auto out = readTable(db, table, parameterColumns());
    for (const auto& p : out)
    {
        log::debug("Found parameter id: " + std::to_string(p.index) +
                   " name: " + p.nl.text);
    }
    return out;
}

std::vector<Datalabel>
    CatalogLoader::readDatalabels(const std::string& table) const
{
    auto out = readTable(db, table, datalabelColumns());
    for (const auto& d : out)
    {
        log::debug("Found datalabel " + std::to_string(d.index) + " | " +
                   d.name + " | " + d.gb.text + " | " + d.gb.description +
                   " | " + d.gb.unit);
    }
    return out;
}

ParameterCatalog
    CatalogLoader::loadParameters(const std::vector<int>& versions) const
{
    return loadCatalog<ParameterCatalog>(
        "parameters", versions, opts.carryOverMissingTables,
        [this](int v) { return parameterTable(v); },
        [this](const std::string& t) { return readParameters(t); });
}

DatalabelCatalog
    CatalogLoader::loadDatalabels(const std::vector<int>& versions) const
{
    return loadCatalog<DatalabelCatalog>(
        "datalabels", versions, opts.carryOverMissingTables,
        [this](int v) { return datalabelTable(v); },
        [this](const std::string& t) { return readDatalabels(t); });
}

} // namespace paramdb::catalog
