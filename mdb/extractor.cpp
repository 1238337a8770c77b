#include "extractor.hpp"

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../core/subprocess.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace paramdb::mdb
{

namespace fs = std::filesystem;

static const ToolConfig& checkTools(const ToolConfig& tools)
{
    for (const auto& t : {tools.schemaTool, tools.tablesTool, tools.exportTool})
    {
        if (!proc::findExecutable(t))
        {
            throw ToolUnavailable(
                "`" + t +
                "` executable not found. Make sure mdbtools is installed and in PATH");
        }
    }
    return tools;
}

static std::string readFile(const fs::path& p)
{
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs.good())
    {
        throw ExtractionError("Cannot read exported file: " + p.string());
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

// Run one tool; stderr output, a non-zero exit or a timeout is fatal.
static proc::Result runTool(const proc::Command& cmd, const std::string& what)
{
    proc::Result res;
    try
    {
        res = proc::run(cmd);
    }
    catch (const std::system_error& e)
    {
        throw ExtractionError("Failed to " + what + ": " + cmd.program + ": " +
                              e.what());
    }

    if (res.timedOut)
    {
        throw ExtractionError("Failed to " + what + ": " + cmd.program +
                              " timed out after " +
                              std::to_string(cmd.timeout.count()) + " ms");
    }
    if (!res.err.empty())
    {
        throw ExtractionError("Failed to " + what + ": " + cmd.program +
                              " reported: " + res.err);
    }
    if (res.exitCode != 0)
    {
        throw ExtractionError("Failed to " + what + ": " + cmd.program +
                              " exited with code " +
                              std::to_string(res.exitCode));
    }
    return res;
}

std::vector<std::string> filterTableList(const std::string& mdbTablesOutput)
{
    std::vector<std::string> out;
    std::istringstream in(mdbTablesOutput);
    std::string line;
    while (std::getline(in, line))
    {
        auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos)
            continue;
        auto e = line.find_last_not_of(" \t\r");
        std::string name = line.substr(b, e - b + 1);

        if (name.front() == mdbconst::kInternalTableMarker)
        {
            log::debug("Skipping internal table: " + name);
            continue;
        }
        out.push_back(std::move(name));
    }
    return out;
}

Extractor::Extractor(const std::string& parameterFile,
                     const ToolConfig& tools) :
    source(parameterFile), cfg(checkTools(tools))
{
    std::error_code ec;
    if (!fs::is_regular_file(source, ec))
    {
        throw InputFileError("Parameter file not found: " + source);
    }

    fs::path name = fs::path(source).filename();
    if (name.extension() == mdbconst::kParameterExtension)
        name.replace_extension(mdbconst::kAccessExtension);
    copy = work.path() / name;

    fs::copy_file(source, copy, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        throw InputFileError("Cannot copy parameter file " + source + ": " +
                             ec.message());
    }
    log::debug("Created temporary file: " + copy.string());
}

Extraction Extractor::extract() const
{
    const fs::path tableDir = work.path() / copy.stem();
    std::error_code ec;
    fs::create_directories(tableDir, ec);
    if (ec)
    {
        throw ExtractionError("Cannot create table directory " +
                              tableDir.string() + ": " + ec.message());
    }
    log::debug("Created temporary table directory: " + tableDir.string());

    Extraction out;
    out.schema = exportSchema(tableDir);
    out.tables = listTables();
    for (const auto& t : out.tables)
    {
        out.inserts.emplace_back(t, exportTable(tableDir, t));
    }
    return out;
}

std::string Extractor::exportSchema(const fs::path& tableDir) const
{
    const fs::path schemaFile = tableDir / mdbconst::kSchemaFile;

    proc::Command cmd;
    cmd.program = cfg.schemaTool;
    cmd.args = {copy.string(), mdbconst::kDialect};
    cmd.stdoutPath = schemaFile.string();
    cmd.timeout = cfg.timeout;
    runTool(cmd, "export schema");

    log::debug("Exported database schema to " + schemaFile.string());
    return readFile(schemaFile);
}

std::vector<std::string> Extractor::listTables() const
{
    proc::Command cmd;
    cmd.program = cfg.tablesTool;
    cmd.args = {"-1", copy.string()};
    cmd.timeout = cfg.timeout;
    auto res = runTool(cmd, "get database tables");

    auto tables = filterTableList(res.out);
    for (const auto& t : tables)
        log::debug("Found database table: " + t);
    return tables;
}

std::string Extractor::exportTable(const fs::path& tableDir,
                                   const std::string& table) const
{
    const fs::path tableFile = tableDir / (table + ".sql");

    proc::Command cmd;
    cmd.program = cfg.exportTool;
    cmd.args = {"-D", mdbconst::kExportDateFormat,
                "-q", mdbconst::kExportQuote,
                "-H",
                "-I", mdbconst::kDialect,
                copy.string(), table};
    cmd.stdoutPath = tableFile.string();
    cmd.timeout = cfg.timeout;
    runTool(cmd, "convert table: " + table);

    log::debug("Converted table: " + table);
    return readFile(tableFile);
}

} // namespace paramdb::mdb
