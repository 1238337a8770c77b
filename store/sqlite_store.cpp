#include "sqlite_store.hpp"

#include "../core/errors.hpp"
#include "../core/logging.hpp"

#include <sqlite3.h>

namespace paramdb::store
{

// Identifier quoting: "name" with embedded quotes doubled.
static std::string quoteIdent(const std::string& name)
{
    std::string out = "\"";
    for (char c : name)
    {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

int Row::columnCount() const
{
    return sqlite3_column_count(stmt);
}

std::string Row::columnName(int i) const
{
    const char* n = sqlite3_column_name(stmt, i);
    return n ? n : "";
}

bool Row::isNull(int i) const
{
    return sqlite3_column_type(stmt, i) == SQLITE_NULL;
}

int64_t Row::getInt(int i) const
{
    return sqlite3_column_int64(stmt, i);
}

double Row::getDouble(int i) const
{
    return sqlite3_column_double(stmt, i);
}

std::string Row::getText(int i) const
{
    const auto* t =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
    if (!t)
        return {};
    return std::string(t, static_cast<size_t>(sqlite3_column_bytes(stmt, i)));
}

Store::Store()
{
    int rc = sqlite3_open(":memory:", &db);
    if (rc != SQLITE_OK)
    {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        db = nullptr;
        throw QueryError("Cannot open in-memory database: " + msg);
    }
}

Store::~Store()
{
    if (!db)
        return;

    if (!sqlite3_get_autocommit(db))
    {
        char* err = nullptr;
        if (sqlite3_exec(db, "COMMIT", nullptr, nullptr, &err) != SQLITE_OK)
        {
            log::warning(std::string("Final commit failed: ") +
                         (err ? err : "unknown error"));
        }
        sqlite3_free(err);
    }
    sqlite3_close(db);
}

void Store::applyScript(const std::string& sql, const std::string& context)
{
    commit();

    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK)
    {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw QueryError("Failed to apply " + context + ": " + msg);
    }
}

void Store::commit()
{
    if (sqlite3_get_autocommit(db))
        return;

    char* err = nullptr;
    if (sqlite3_exec(db, "COMMIT", nullptr, nullptr, &err) != SQLITE_OK)
    {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw QueryError("Commit failed: " + msg);
    }
}

void Store::load(const mdb::Extraction& ex)
{
    applyScript(ex.schema, "database schema");
    commit();

    for (const auto& [table, sql] : ex.inserts)
    {
        applyScript(sql, "table " + table);
        log::debug("Imported table: " + table);
    }
    commit();
}

void Store::selectOrderedByIndex(const std::string& table,
                                 const HeaderVisitor& header,
                                 const RowVisitor& visit) const
{
    const std::string query =
        "SELECT * FROM " + quoteIdent(table) + " ORDER BY \"Index\" ASC";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, query.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw QueryError("Query on table '" + table + "' failed: " + msg);
    }

    // Finalize on every exit path, including exceptions from the visitor.
    struct Finalizer
    {
        sqlite3_stmt* s;
        ~Finalizer()
        {
            sqlite3_finalize(s);
        }
    } guard{stmt};

    if (header)
    {
        std::vector<std::string> names;
        const int n = sqlite3_column_count(stmt);
        for (int i = 0; i < n; ++i)
        {
            const char* c = sqlite3_column_name(stmt, i);
            names.emplace_back(c ? c : "");
        }
        header(names);
    }

    Row row(stmt);
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        visit(row);
    }
    if (rc != SQLITE_DONE)
    {
        throw QueryError("Query on table '" + table +
                         "' failed: " + sqlite3_errmsg(db));
    }
}

} // namespace paramdb::store
