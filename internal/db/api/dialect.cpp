#include "internal/db/api/schema_repository.hpp"

namespace relaystore::db {

const char* DialectName(Dialect dialect) {
  switch (dialect) {
    case Dialect::kPostgres:
      return "postgres";
    case Dialect::kSqlite:
      return "sqlite";
  }
  return "unknown";
}

} // namespace relaystore::db
