#pragma once

namespace registry::db::sql {

/*
  Canonical SQL for the registrations table.

  Timestamps are generated by the engine so that every row carries
  the store's clock, formatted as ISO-8601 UTC with milliseconds.
*/

static constexpr const char* INSERT_REGISTRATION =
    "INSERT INTO registrations(eth_address,rgb_address,signature,message,created_at,updated_at)"
    " VALUES(?,?,?,?,strftime('%Y-%m-%dT%H:%M:%fZ','now'),strftime('%Y-%m-%dT%H:%M:%fZ','now'))"
    " RETURNING id,created_at,updated_at;";

static constexpr const char* SELECT_REGISTRATIONS =
    "SELECT id,eth_address,rgb_address,signature,message,created_at,updated_at"
    " FROM registrations ORDER BY id ASC;";

// schema

static constexpr const char* CREATE_REGISTRATIONS =
    "CREATE TABLE IF NOT EXISTS registrations ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " eth_address TEXT NOT NULL,"
    " rgb_address TEXT NOT NULL,"
    " signature TEXT NOT NULL,"
    " message TEXT NOT NULL,"
    " created_at TEXT NOT NULL,"
    " updated_at TEXT NOT NULL,"
    " UNIQUE(eth_address, rgb_address));";

static constexpr const char* CREATE_INDEXES =
    "CREATE INDEX IF NOT EXISTS idx_eth_address ON registrations(eth_address);"
    "CREATE INDEX IF NOT EXISTS idx_rgb_address ON registrations(rgb_address);"
    "CREATE INDEX IF NOT EXISTS idx_created_at ON registrations(created_at);";

static constexpr const char* CREATE_SCHEMA_MIGRATIONS =
    "CREATE TABLE IF NOT EXISTS schema_migrations ("
    " version INTEGER PRIMARY KEY,"
    " applied_at TEXT NOT NULL);";

}
