#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace paramdb::log
{

enum class Level
{
    debug = 0,
    info,
    warning,
    error,
};

struct Settings
{
    Level threshold{Level::info};
    std::string path; // optional log file, empty -> stderr only
};

inline Settings& settings()
{
    static Settings s;
    return s;
}

inline const char* levelName(Level l)
{
    switch (l)
    {
        case Level::debug:
            return "DEBUG";
        case Level::info:
            return "INFO";
        case Level::warning:
            return "WARN";
        case Level::error:
            return "ERROR";
    }
    return "?";
}

// Parse "debug"/"info"/"warning"/"error". Throws on anything else.
inline Level parseLevel(const std::string& s)
{
    if (s == "debug")
        return Level::debug;
    if (s == "info")
        return Level::info;
    if (s == "warning" || s == "warn")
        return Level::warning;
    if (s == "error")
        return Level::error;
    throw std::runtime_error("Unknown log level: " + s);
}

inline std::string nowIso()
{
    using namespace std::chrono;
    auto t = system_clock::now();
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm = *std::gmtime(&tt);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Append a timestamped line to the given path, creating directories as needed.
inline void appendLine(const std::string& path, const std::string& line)
{
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(path).parent_path(), ec);
    std::ofstream f(path, std::ios::app);
    f << nowIso() << " " << line << "\n";
}

inline void write(Level l, const std::string& msg)
{
    const auto& s = settings();
    if (l < s.threshold)
        return;

    std::cerr << "[paramdb] " << levelName(l) << " " << msg << "\n";
    if (!s.path.empty())
        appendLine(s.path, std::string(levelName(l)) + " " + msg);
}

inline void debug(const std::string& msg)
{
    write(Level::debug, msg);
}

inline void info(const std::string& msg)
{
    write(Level::info, msg);
}

inline void warning(const std::string& msg)
{
    write(Level::warning, msg);
}

inline void error(const std::string& msg)
{
    write(Level::error, msg);
}

} // namespace paramdb::log
