#include "subprocess.hpp"

#include "logging.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <system_error>
#include <thread>

namespace paramdb::proc
{

namespace
{

using Clock = std::chrono::steady_clock;

// Owns one end of a pipe.
struct Fd
{
    int fd{-1};

    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd()
    {
        reset();
    }

    void reset()
    {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
    }
};

void makePipe(Fd& readEnd, Fd& writeEnd)
{
    int link[2];
    if (::pipe2(link, O_CLOEXEC) == -1)
    {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    readEnd.fd = link[0];
    writeEnd.fd = link[1];
}

int decodeStatus(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Milliseconds left before the deadline, -1 for "no deadline".
int remainingMs(const std::optional<Clock::time_point>& deadline)
{
    if (!deadline)
        return -1;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline - Clock::now());
    if (left.count() <= 0)
        return 0;
    if (left.count() > std::numeric_limits<int>::max())
        return std::numeric_limits<int>::max();
    return static_cast<int>(left.count());
}

} // namespace

Result run(const Command& cmd)
{
    Result res;

    std::vector<char*> argv;
    argv.reserve(cmd.args.size() + 2);
    argv.push_back(const_cast<char*>(cmd.program.c_str()));
    log::debug("(shell) exec \"" + cmd.program + "\"");
    for (const auto& a : cmd.args)
    {
        argv.push_back(const_cast<char*>(a.c_str()));
        log::debug("(shell) arg \"" + a + "\"");
    }
    argv.push_back(nullptr);

    Fd outRead, outWrite, errRead, errWrite;
    makePipe(errRead, errWrite);

    if (cmd.stdoutPath.empty())
    {
        makePipe(outRead, outWrite);
    }
    else
    {
        outWrite.fd = ::open(cmd.stdoutPath.c_str(),
                             O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (outWrite.fd < 0)
        {
            throw std::system_error(errno, std::generic_category(),
                                    "open " + cmd.stdoutPath);
        }
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0)
    {
        // Child: stdin from /dev/null, stdout/stderr to our descriptors.
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0)
            ::dup2(devnull, STDIN_FILENO);
        ::dup2(outWrite.fd, STDOUT_FILENO);
        ::dup2(errWrite.fd, STDERR_FILENO);

        ::execvp(cmd.program.c_str(), argv.data());

        std::string msg = "exec " + cmd.program +
                          " failed: " + std::strerror(errno) + "\n";
        ssize_t n = ::write(STDERR_FILENO, msg.data(), msg.size());
        (void)n;
        ::_exit(127);
    }

    outWrite.reset();
    errWrite.reset();

    std::optional<Clock::time_point> deadline;
    if (cmd.timeout.count() > 0)
        deadline = Clock::now() + cmd.timeout;

    auto killChild = [&]() {
        log::warning("(shell) " + cmd.program + " timed out after " +
                     std::to_string(cmd.timeout.count()) + " ms, killing " +
                     std::to_string(pid));
        ::kill(pid, SIGKILL);
        res.timedOut = true;
    };

    // Drain both pipes until EOF or deadline.
    char buf[32768];
    while (!res.timedOut && (outRead.fd >= 0 || errRead.fd >= 0))
    {
        if (deadline && Clock::now() >= *deadline)
        {
            killChild();
            break;
        }

        pollfd fds[2];
        nfds_t n = 0;
        if (outRead.fd >= 0)
            fds[n++] = pollfd{outRead.fd, POLLIN, 0};
        if (errRead.fd >= 0)
            fds[n++] = pollfd{errRead.fd, POLLIN, 0};

        int rc = ::poll(fds, n, remainingMs(deadline));
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            int e = errno;
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            throw std::system_error(e, std::generic_category(), "poll");
        }
        if (rc == 0)
        {
            killChild();
            break;
        }

        for (nfds_t i = 0; i < n; ++i)
        {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;

            Fd& src = (fds[i].fd == outRead.fd) ? outRead : errRead;
            std::string& dst = (&src == &outRead) ? res.out : res.err;

            ssize_t got = ::read(src.fd, buf, sizeof(buf));
            if (got > 0)
            {
                // Past the limit the pipe is still drained, only not kept.
                size_t keep = 0;
                if (dst.size() < kCaptureLimit)
                    keep = std::min(kCaptureLimit - dst.size(),
                                    static_cast<size_t>(got));
                dst.append(buf, keep);
                if (keep < static_cast<size_t>(got))
                    res.truncated = true;
            }
            else if (got == 0 || errno != EINTR)
                src.reset();
        }
    }

    // Pipes are closed; the child may still be exiting.
    int status = 0;
    for (;;)
    {
        pid_t w = ::waitpid(pid, &status, res.timedOut ? 0 : WNOHANG);
        if (w == pid)
            break;
        if (w < 0 && errno != EINTR)
        {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        if (w == 0)
        {
            if (deadline && remainingMs(deadline) == 0)
            {
                killChild();
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    res.exitCode = decodeStatus(status);
    log::debug("(shell) " + cmd.program + ": return code " +
               std::to_string(res.exitCode));
    return res;
}

std::optional<std::string> findExecutable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    auto usable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos)
    {
        if (usable(name))
            return name;
        return std::nullopt;
    }

    const char* env = std::getenv("PATH");
    std::string path = env ? env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path.size())
    {
        size_t end = path.find(':', start);
        if (end == std::string::npos)
            end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty())
            dir = ".";

        fs::path candidate = fs::path(dir) / name;
        if (usable(candidate))
            return candidate.string();

        start = end + 1;
    }
    return std::nullopt;
}

} // namespace paramdb::proc
