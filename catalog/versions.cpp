#include "versions.hpp"

#include "../core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace paramdb::catalog
{

std::optional<int> tableVersion(const std::string& table)
{
    static const std::regex versionMatch(".+V[0-9]{1,2}");
    if (!std::regex_match(table, versionMatch))
        return std::nullopt;

    auto pos = table.rfind("_V");
    if (pos == std::string::npos)
    {
        log::warning("Table " + table + " looks versioned but has no _V suffix");
        return std::nullopt;
    }

    const std::string digits = table.substr(pos + 2);
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c); }))
    {
        log::warning("Table " + table + " has a non-numeric version suffix");
        return std::nullopt;
    }
    return std::stoi(digits);
}

std::vector<int> findVersions(const std::vector<std::string>& tables)
{
    int maxVersion = 0;
    for (const auto& t : tables)
    {
        if (auto v = tableVersion(t))
            maxVersion = std::max(maxVersion, *v);
    }

    std::vector<int> versions;
    for (int v = 1; v <= maxVersion; ++v)
        versions.push_back(v);

    std::string list;
    for (int v : versions)
        list += (list.empty() ? "" : ", ") + std::to_string(v);
    log::debug("Found versions: [" + list + "]");
    return versions;
}

} // namespace paramdb::catalog
