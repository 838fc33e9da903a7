#pragma once

#include "sqlite_db.hpp"

namespace reel::db::sqlite {

// Creates the task and scene tables if missing and checks the expected
// columns are readable.
void BootstrapSchema(SqliteDB& db);

} // namespace reel::db::sqlite
