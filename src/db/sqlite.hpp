#pragma once

#include <memory>
#include <string>
#include <variant>

#include <sqlite3.h>

#define MEMORY_DB_PATH ":memory:"

// opens (and creates) a database, missing parent folders are created
std::variant<std::shared_ptr<sqlite3>, std::string> db_open(const std::string &path);

// runs a statement without results, throws std::runtime_error on failure
void db_exec(const std::shared_ptr<sqlite3> &db, const std::string &query, const std::string &what);
