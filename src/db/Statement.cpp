#include "db/Statement.hpp"

namespace DryDock {

Statement::Statement(sqlite3* db, const char* sql) : db_(db), stmt_(nullptr) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
}

int Statement::step() {
    return sqlite3_step(stmt_);
}

std::int64_t Statement::columnInt64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::string Statement::columnText(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

bool Statement::columnIsNull(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

Error sqliteError(sqlite3* db, const std::string& context) {
    return Error(ErrorCode::Database, context + ": " + (db ? sqlite3_errmsg(db) : "no database handle"));
}

}
