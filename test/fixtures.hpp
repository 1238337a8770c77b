#pragma once

#include <sys/stat.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace paramdb::test
{

inline void writeFile(const std::filesystem::path& p, const std::string& body)
{
    std::ofstream ofs(p, std::ios::out | std::ios::trunc | std::ios::binary);
    ofs << body;
}

// Write an executable /bin/sh script and return its path.
inline std::string writeScript(const std::filesystem::path& dir,
                               const std::string& name,
                               const std::string& body)
{
    auto p = dir / name;
    writeFile(p, "#!/bin/sh\n" + body);
    ::chmod(p.c_str(), 0755);
    return p.string();
}

inline std::string sqlQuote(const std::string& s)
{
    std::string out = "'";
    for (char c : s)
    {
        if (c == '\'')
            out += '\'';
        out += c;
    }
    return out + "'";
}

inline std::string parameterDdl(const std::string& table)
{
    return "CREATE TABLE \"" + table +
           "\" (\"Index\" INTEGER, \"Volgorde\" INTEGER, \"Naam\" TEXT, "
           "\"Naam_fabriek\" TEXT, \"Min\" REAL, \"Max\" REAL, "
           "\"Default\" REAL, \"Tekst_NL\" TEXT, \"Omschrijving_NL\" TEXT, "
           "\"Eenheid_NL\" TEXT, \"Tekst_GB\" TEXT, \"Omschrijving_GB\" TEXT, "
           "\"Eenheid_GB\" TEXT, \"Tekst_D\" TEXT, \"Omschrijving_D\" TEXT, "
           "\"Eenheid_D\" TEXT, \"Subtabel\" TEXT, \"Paswoordnivo\" INTEGER);\n";
}

inline std::string datalabelDdl(const std::string& table)
{
    return "CREATE TABLE \"" + table +
           "\" (\"Index\" INTEGER, \"Naam\" TEXT, \"Tekst_NL\" TEXT, "
           "\"Tooltip_NL\" TEXT, \"Eenheid_NL\" TEXT, \"Tekst_GB\" TEXT, "
           "\"Tooltip_GB\" TEXT, \"Eenheid_GB\" TEXT, \"Tekst_D\" TEXT, "
           "\"Tooltip_D\" TEXT, \"Eenheid_D\" TEXT, \"SubTabel\" TEXT, "
           "\"Visible\" INTEGER);\n";
}

inline std::string parameterInsert(const std::string& table, int index,
                                   const std::string& textGb, double min,
                                   double max, double def,
                                   const std::string& unit = "")
{
    const std::string i = std::to_string(index);
    return "INSERT INTO \"" + table + "\" VALUES (" + i + ", " + i + ", " +
           sqlQuote("par" + i) + ", " + sqlQuote("fab" + i) + ", " +
           std::to_string(min) + ", " + std::to_string(max) + ", " +
           std::to_string(def) + ", " + sqlQuote("nl " + textGb) + ", " +
           sqlQuote("omschrijving") + ", " + sqlQuote(unit) + ", " +
           sqlQuote(textGb) + ", " + sqlQuote("description") + ", " +
           sqlQuote(unit) + ", " + sqlQuote("d " + textGb) + ", " +
           sqlQuote("Beschreibung") + ", " + sqlQuote(unit) + ", " +
           sqlQuote("") + ", 2);\n";
}

inline std::string datalabelInsert(const std::string& table, int index,
                                   const std::string& textGb,
                                   const std::string& tooltipGb,
                                   const std::string& unitGb,
                                   const std::string& unitNl = "")
{
    const std::string i = std::to_string(index);
    const std::string nlUnit = unitNl.empty() ? unitGb : unitNl;
    return "INSERT INTO \"" + table + "\" VALUES (" + i + ", " +
           sqlQuote("label" + i) + ", " + sqlQuote("nl " + textGb) + ", " +
           sqlQuote("nl " + tooltipGb) + ", " + sqlQuote(nlUnit) + ", " +
           sqlQuote(textGb) + ", " + sqlQuote(tooltipGb) + ", " +
           sqlQuote(unitGb) + ", " + sqlQuote("d " + textGb) + ", " +
           sqlQuote("d " + tooltipGb) + ", " + sqlQuote(unitGb) + ", " +
           sqlQuote("") + ", 1);\n";
}

} // namespace paramdb::test
