#include "buildjson/buildjson.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "output/assembler.hpp"
#include "pipeline/parameter_database.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

namespace
{

enum class Command
{
    listVersions,
    parameters,
    datalabels,
    sensors,
};

struct Options
{
    std::string configPath;
    std::string outputPath;
    std::string parameterFile;
    std::optional<int> version;
    Command command{Command::sensors};
    bool verbose{false};
};

void usage(std::ostream& os)
{
    os << "usage: itho-paramdb [-c config.json] [-v version] [-o out.json] "
          "[-d]\n"
          "                    [--list-versions | --parameters | "
          "--datalabels | --sensors]\n"
          "                    <parameter-file>\n";
}

// Returns nullopt on a usage error (already reported).
std::optional<Options> parseArgs(int argc, char** argv)
{
    Options o;
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc)
            {
                std::cerr << "[paramdb] missing value for " << a << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (a == "-h" || a == "--help")
        {
            usage(std::cout);
            std::exit(0);
        }
        else if (a == "-c" || a == "--config")
        {
            auto v = next();
            if (!v)
                return std::nullopt;
            o.configPath = *v;
        }
        else if (a == "-o" || a == "--output")
        {
            auto v = next();
            if (!v)
                return std::nullopt;
            o.outputPath = *v;
        }
        else if (a == "-v" || a == "--version")
        {
            auto v = next();
            if (!v)
                return std::nullopt;
            try
            {
                o.version = std::stoi(*v);
            }
            catch (const std::exception&)
            {
                std::cerr << "[paramdb] version must be a number: " << *v
                          << "\n";
                return std::nullopt;
            }
        }
        else if (a == "-d" || a == "--debug")
            o.verbose = true;
        else if (a == "--list-versions")
            o.command = Command::listVersions;
        else if (a == "--parameters")
            o.command = Command::parameters;
        else if (a == "--datalabels")
            o.command = Command::datalabels;
        else if (a == "--sensors")
            o.command = Command::sensors;
        else if (!a.empty() && a[0] == '-')
        {
            std::cerr << "[paramdb] unknown option: " << a << "\n";
            return std::nullopt;
        }
        else if (o.parameterFile.empty())
            o.parameterFile = a;
        else
        {
            std::cerr << "[paramdb] unexpected argument: " << a << "\n";
            return std::nullopt;
        }
    }

    if (o.parameterFile.empty())
    {
        std::cerr << "[paramdb] no parameter file given\n";
        return std::nullopt;
    }
    return o;
}

int run(const Options& opts)
{
    paramdb::Config cfg = opts.configPath.empty()
                              ? paramdb::defaultConfig()
                              : paramdb::loadConfigFromJsonFile(opts.configPath);

    auto& logSettings = paramdb::log::settings();
    logSettings.threshold =
        opts.verbose ? paramdb::log::Level::debug : cfg.logging.level;
    logSettings.path = cfg.logging.path;

    paramdb::ParameterDatabase db(opts.parameterFile, cfg);
    db.load();

    const auto& versions = db.versions();
    if (opts.command == Command::listVersions)
    {
        paramdb::output::Document doc = versions;
        paramdb::output::write(doc, opts.outputPath);
        return 0;
    }

    // Default to the newest firmware version.
    int version = 0;
    if (opts.version)
        version = *opts.version;
    else if (!versions.empty())
        version = versions.back();
    else
    {
        paramdb::log::error("No versioned tables in " + opts.parameterFile);
        return 1;
    }

    switch (opts.command)
    {
        case Command::parameters:
            paramdb::output::write(
                paramdb::output::assemble(db.parameters(version)),
                opts.outputPath);
            break;
        case Command::datalabels:
            paramdb::output::write(
                paramdb::output::assemble(db.datalabels(version)),
                opts.outputPath);
            break;
        case Command::sensors:
        case Command::listVersions:
            paramdb::output::write(
                paramdb::output::assemble(db.sensors(version)),
                opts.outputPath);
            break;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto opts = parseArgs(argc, argv);
    if (!opts)
    {
        usage(std::cerr);
        return 2;
    }

    try
    {
        return run(*opts);
    }
    catch (const paramdb::Error& e)
    {
        paramdb::log::error(e.what());
    }
    catch (const std::exception& e)
    {
        paramdb::log::error(std::string("Unexpected error: ") + e.what());
    }
    return 1;
}
