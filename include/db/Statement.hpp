#pragma once
#include "utils/Error.hpp"
#include <cstdint>
#include <string>
#include <sqlite3.h>

namespace DryDock {

// Owns one prepared statement; finalized on destruction.
class Statement {
public:
    Statement(sqlite3* db, const char* sql);
    ~Statement();
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind(int index, const std::string& value);
    void bind(int index, std::int64_t value);

    int step();

    std::int64_t columnInt64(int col) const;
    std::string columnText(int col) const;
    bool columnIsNull(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

// Database error carrying sqlite's message for the handle.
Error sqliteError(sqlite3* db, const std::string& context);

}
