#include "tempdir.hpp"

#include "logging.hpp"

#include <stdlib.h>

#include <cerrno>
#include <system_error>
#include <vector>

namespace paramdb::core
{

namespace fs = std::filesystem;

TempDir::TempDir(const std::string& prefix)
{
    std::string tmpl =
        (fs::temp_directory_path() / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr)
    {
        throw std::system_error(errno, std::generic_category(),
                                "mkdtemp " + tmpl);
    }
    dir = buf.data();
    log::debug("Created temporary directory: " + dir.string());
}

TempDir::~TempDir()
{
    remove();
}

TempDir::TempDir(TempDir&& other) noexcept : dir(std::move(other.dir))
{
    other.dir.clear();
}

TempDir& TempDir::operator=(TempDir&& other) noexcept
{
    if (this != &other)
    {
        remove();
        dir = std::move(other.dir);
        other.dir.clear();
    }
    return *this;
}

void TempDir::remove()
{
    if (dir.empty())
        return;

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
    {
        log::warning("Failed to remove temporary directory " + dir.string() +
                     ": " + ec.message());
    }
    else
    {
        log::debug("Removed temporary directory: " + dir.string());
    }
    dir.clear();
}

} // namespace paramdb::core
