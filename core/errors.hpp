#pragma once

#include <stdexcept>
#include <string>

namespace paramdb
{

// Base of every error raised by the pipeline. Messages carry the path, tool,
// table or version implicated.
class Error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// A required mdbtools executable could not be found in PATH.
class ToolUnavailable : public Error
{
  public:
    using Error::Error;
};

// The parameter file is missing or unreadable.
class InputFileError : public Error
{
  public:
    using Error::Error;
};

// An extraction tool wrote to stderr, exited non-zero or timed out.
class ExtractionError : public Error
{
  public:
    using Error::Error;
};

// A SQL statement against the in-memory store failed.
class QueryError : public Error
{
  public:
    using Error::Error;
};

// A catalog table does not have the expected columns, or repeats an index.
class SchemaMismatch : public Error
{
  public:
    using Error::Error;
};

// More than one device class matches a unit.
class AmbiguousClassification : public Error
{
  public:
    using Error::Error;
};

// A catalog was requested for a version that was never discovered.
class UnknownVersion : public Error
{
  public:
    UnknownVersion(int version) :
        Error("Firmware version: " + std::to_string(version) + " not found"),
        ver(version)
    {}

    int version() const
    {
        return ver;
    }

  private:
    int ver;
};

} // namespace paramdb
