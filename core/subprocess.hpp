#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace paramdb::proc
{

struct Command
{
    std::string program; // resolved through PATH when it has no '/'
    std::vector<std::string> args;

    // When set, the child's stdout is written to this file instead of being
    // captured.
    std::string stdoutPath;

    // Zero disables the timeout.
    std::chrono::milliseconds timeout{0};
};

// Bytes of stdout and of stderr kept in a Result; the rest is discarded.
inline constexpr std::size_t kCaptureLimit = 64 * 1024;

struct Result
{
    int exitCode{-1}; // 128 + signal when the child was killed
    std::string out;
    std::string err;
    bool timedOut{false};
    bool truncated{false}; // out or err hit kCaptureLimit
};

// Run a command to completion. Throws std::system_error when the pipes or
// the fork cannot be set up; a program that cannot be executed yields exit
// code 127 and a message on stderr.
Result run(const Command& cmd);

// `which`: resolve an executable through PATH. Names with a '/' are checked
// as given.
std::optional<std::string> findExecutable(const std::string& name);

} // namespace paramdb::proc
