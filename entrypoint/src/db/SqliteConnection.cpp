#include "db/SqliteConnection.h"

#include <memory>
#include <stdexcept>
#include <utility>

namespace bootgate::entrypoint::db {

namespace {

struct StatementFinalizer {
    void operator()(sqlite3_stmt* statement) const { sqlite3_finalize(statement); }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

}  // namespace

SqliteConnection::SqliteConnection(std::string dbPath) : dbPath(std::move(dbPath)), connection(nullptr) {}

SqliteConnection::~SqliteConnection() { close(); }

void SqliteConnection::throwOnError(int resultCode, const std::string& context) {
    if (resultCode != SQLITE_OK && resultCode != SQLITE_DONE && resultCode != SQLITE_ROW) {
        const char* message = connection != nullptr ? sqlite3_errmsg(connection) : sqlite3_errstr(resultCode);
        throw std::runtime_error(context + ": " + message);
    }
}

void SqliteConnection::open() {
    if (connection != nullptr) {
        return;
    }

    int result = sqlite3_open_v2(dbPath.c_str(), &connection, SQLITE_OPEN_READWRITE, nullptr);
    if (result != SQLITE_OK) {
        // sqlite3_open_v2 hands out a handle even on failure; it carries the error message.
        std::string message = connection != nullptr ? sqlite3_errmsg(connection) : sqlite3_errstr(result);
        close();
        throw std::runtime_error("open database " + dbPath + ": " + message);
    }
}

void SqliteConnection::close() {
    if (connection != nullptr) {
        sqlite3_close(connection);
        connection = nullptr;
    }
}

std::vector<std::map<std::string, std::string>> SqliteConnection::query(const std::string& sql) {
    if (connection == nullptr) {
        throw std::runtime_error("database not opened");
    }

    sqlite3_stmt* raw = nullptr;
    int prepareResult = sqlite3_prepare_v2(connection, sql.c_str(), -1, &raw, nullptr);
    StatementPtr statement(raw);
    throwOnError(prepareResult, "prepare statement");

    std::vector<std::map<std::string, std::string>> rows;

    int columnCount = sqlite3_column_count(statement.get());
    int stepResult = sqlite3_step(statement.get());
    while (stepResult == SQLITE_ROW) {
        std::map<std::string, std::string> row;
        for (int columnIndex = 0; columnIndex < columnCount; ++columnIndex) {
            const char* columnName = sqlite3_column_name(statement.get(), columnIndex);
            const unsigned char* text = sqlite3_column_text(statement.get(), columnIndex);
            row[columnName] = text != nullptr ? reinterpret_cast<const char*>(text) : "";
        }
        rows.push_back(std::move(row));
        stepResult = sqlite3_step(statement.get());
    }

    throwOnError(stepResult, "iterate query results");

    return rows;
}

}  // namespace bootgate::entrypoint::db
