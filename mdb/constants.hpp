#pragma once

namespace paramdb::mdbconst
{

// mdbtools executables (overridable from config).
inline constexpr const char* kSchemaTool = "mdb-schema";
inline constexpr const char* kTablesTool = "mdb-tables";
inline constexpr const char* kExportTool = "mdb-export";

// Destination dialect for both schema and INSERT export.
inline constexpr const char* kDialect = "sqlite";

// Access keeps internal/temporary tables under names starting with '~'.
inline constexpr char kInternalTableMarker = '~';

// mdb-export formatting: quoted timestamps and single-quote string literals.
inline constexpr const char* kExportDateFormat = "'%Y-%m-%d %H:%M:%S'";
inline constexpr const char* kExportQuote = "'";

// Itho ships Access databases with a .par extension.
inline constexpr const char* kParameterExtension = ".par";
inline constexpr const char* kAccessExtension = ".mdb";

inline constexpr const char* kSchemaFile = "schema.sqlite";

} // namespace paramdb::mdbconst
