#pragma once
#include "utils/Error.hpp"
#include <sqlite3.h>

namespace DryDock {
namespace Schema {

// Idempotent: every statement is CREATE ... IF NOT EXISTS, so it runs on each start.
Error migrate(sqlite3* db);

}
}
