#pragma once

namespace hostreg::db::sql {

/*
  Canonical SQL for the services table.

  Column order is shared by every SELECT below and by the row decoder:
    name, description, port, health_endpoint, base_url,
    lifecycle_stage, run_state, last_scanned_at_ms, created_at_ms, updated_at_ms
*/

static constexpr const char* INSERT_SERVICE =
    "INSERT INTO services(name,description,port,health_endpoint,base_url,"
    "lifecycle_stage,run_state,last_scanned_at_ms,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SERVICE =
    "SELECT name,description,port,health_endpoint,base_url,"
    "lifecycle_stage,run_state,last_scanned_at_ms,created_at_ms,updated_at_ms"
    " FROM services WHERE name=?;";

static constexpr const char* LIST_SERVICES =
    "SELECT name,description,port,health_endpoint,base_url,"
    "lifecycle_stage,run_state,last_scanned_at_ms,created_at_ms,updated_at_ms"
    " FROM services ORDER BY name;";

static constexpr const char* UPDATE_SERVICE =
    "UPDATE services SET description=?,port=?,health_endpoint=?,base_url=?,"
    "lifecycle_stage=?,run_state=?,last_scanned_at_ms=?,updated_at_ms=?"
    " WHERE name=?;";

static constexpr const char* DELETE_SERVICE =
    "DELETE FROM services WHERE name=?;";

} // namespace hostreg::db::sql
