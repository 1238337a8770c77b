#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace paramdb::catalog
{

// Language columns in the Itho tables: NL, GB (English), D (German).
enum class Language
{
    NL,
    GB,
    D,
};

// Throws std::runtime_error for anything but "NL", "GB" or "D".
Language parseLanguage(const std::string& s);
const char* languageSuffix(Language l);

struct LocalizedText
{
    std::string text;        // Tekst_*
    std::string description; // Omschrijving_* (parameters), Tooltip_* (datalabels)
    std::string unit;        // Eenheid_*
};

// One row of Parameterlijst_V<n>.
struct Parameter
{
    int64_t index{};        // Index
    int64_t order{};        // Volgorde
    std::string name;       // Naam
    std::string factoryName; // Naam_fabriek
    double min{};
    double max{};
    double defaultValue{};
    LocalizedText nl;
    LocalizedText gb;
    LocalizedText d;
    std::string subtable;   // Subtabel
    int64_t passwordLevel{}; // Paswoordnivo

    const LocalizedText& text(Language l) const;
};

// One row of Datalabel_V<n>.
struct Datalabel
{
    int64_t index{};   // Index
    std::string name;  // Naam
    LocalizedText nl;  // description holds Tooltip_NL
    LocalizedText gb;
    LocalizedText d;
    std::string subtable; // SubTabel
    bool visible{};

    const LocalizedText& text(Language l) const;
};

using ParameterCatalog = std::map<int, std::vector<Parameter>>;
using DatalabelCatalog = std::map<int, std::vector<Datalabel>>;

} // namespace paramdb::catalog
