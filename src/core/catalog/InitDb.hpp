// src/core/catalog/InitDb.hpp
#pragma once
#include <string>

// Creates the database file if needed and applies schema.sql. Idempotent.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);
