#pragma once

#include "../core/tempdir.hpp"
#include "constants.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace paramdb::mdb
{

struct ToolConfig
{
    std::string schemaTool{mdbconst::kSchemaTool};
    std::string tablesTool{mdbconst::kTablesTool};
    std::string exportTool{mdbconst::kExportTool};
    std::chrono::seconds timeout{60};
};

// Everything the store needs to rebuild the Access database.
struct Extraction
{
    std::string schema;                // sqlite DDL
    std::vector<std::string> tables;   // '~' tables removed, file order
    std::vector<std::pair<std::string, std::string>> inserts; // table -> SQL
};

// Wraps mdb-schema / mdb-tables / mdb-export on a private copy of the
// parameter file. The copy and all intermediate exports live in a working
// directory that is removed with the extractor.
class Extractor
{
  public:
    // Throws ToolUnavailable if a tool is not in PATH (checked before the
    // input is touched) and InputFileError if the input cannot be copied.
    Extractor(const std::string& parameterFile, const ToolConfig& tools);

    // Throws ExtractionError on any tool failure; nothing partial is
    // returned.
    Extraction extract() const;

    const std::filesystem::path& workingCopy() const
    {
        return copy;
    }

    const std::filesystem::path& workDir() const
    {
        return work.path();
    }

  private:
    std::string exportSchema(const std::filesystem::path& tableDir) const;
    std::vector<std::string> listTables() const;
    std::string exportTable(const std::filesystem::path& tableDir,
                            const std::string& table) const;

    std::string source;
    ToolConfig cfg;
    core::TempDir work;
    std::filesystem::path copy;
};

// Drop blank lines and names starting with the internal-table marker.
std::vector<std::string> filterTableList(const std::string& mdbTablesOutput);

} // namespace paramdb::mdb
