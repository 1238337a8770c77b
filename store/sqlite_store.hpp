#pragma once

#include "../mdb/extractor.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace paramdb::store
{

// One result row; only valid inside the visitor call.
class Row
{
  public:
    explicit Row(sqlite3_stmt* s) : stmt(s) {}

    int columnCount() const;
    std::string columnName(int i) const;
    bool isNull(int i) const;
    int64_t getInt(int i) const;
    double getDouble(int i) const;
    std::string getText(int i) const; // NULL -> ""

  private:
    sqlite3_stmt* stmt;
};

using RowVisitor = std::function<void(const Row&)>;
using HeaderVisitor = std::function<void(const std::vector<std::string>&)>;

// In-memory SQLite database rebuilt from an mdbtools extraction. Load-only:
// nothing is updated or deleted after load(). The destructor commits a
// pending transaction and closes the connection.
class Store
{
  public:
    Store();
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // Execute a multi-statement script. A pending transaction is committed
    // first so scripts may carry their own BEGIN/COMMIT. Throws QueryError
    // mentioning `context`.
    void applyScript(const std::string& sql, const std::string& context);

    // Commit the open transaction, if any.
    void commit();

    // Schema, commit, every table's inserts, commit.
    void load(const mdb::Extraction& ex);

    // SELECT * FROM "<table>" ORDER BY "Index" ASC. `header` sees the
    // column names once, before any row and even when the table is empty.
    void selectOrderedByIndex(const std::string& table,
                              const HeaderVisitor& header,
                              const RowVisitor& visit) const;

  private:
    sqlite3* db{nullptr};
};

} // namespace paramdb::store
