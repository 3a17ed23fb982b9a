#pragma once

#include <map>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace bootgate::entrypoint::db {

// Read-write handle on an existing SQLite database. Never creates the file.
class SqliteConnection {
public:
    explicit SqliteConnection(std::string dbPath);
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    // Throws std::runtime_error if the file is missing or cannot be opened.
    void open();
    void close();

    std::vector<std::map<std::string, std::string>> query(const std::string& sql);

private:
    void throwOnError(int resultCode, const std::string& context);

    std::string dbPath;
    sqlite3* connection;
};

}  // namespace bootgate::entrypoint::db
