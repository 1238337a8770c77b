#pragma once

#include <filesystem>
#include <string>

namespace paramdb::core
{

// Private working directory, removed recursively on destruction.
class TempDir
{
  public:
    explicit TempDir(const std::string& prefix = "paramdb");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&& other) noexcept;

    const std::filesystem::path& path() const
    {
        return dir;
    }

  private:
    void remove();

    std::filesystem::path dir;
};

} // namespace paramdb::core
