#pragma once

#include <optional>
#include <string>
#include <vector>

namespace paramdb::catalog
{

// Version number of a version-tagged table ("Datalabel_V12" -> 12).
// Returns nullopt for names that do not end in V<1-2 digits> or whose text
// after the last "_V" is not a number.
std::optional<int> tableVersion(const std::string& table);

// All versions 1..max over the version-tagged tables, ascending. Versions
// without tables of their own are still listed.
std::vector<int> findVersions(const std::vector<std::string>& tables);

} // namespace paramdb::catalog
