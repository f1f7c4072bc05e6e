#include "pg_schema_repository.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace relaystore::db::postgres {

namespace {

std::optional<std::string> NullableBytes(const pqxx::field& f) {
  if (f.is_null()) {
    return std::nullopt;
  }
  return util::HexDecode(f.c_str());
}

} // namespace

PgSchemaRepository::PgSchemaRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgSchemaRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

std::unique_ptr<db::Transaction> PgSchemaRepository::BeginSnapshot() {
  return std::make_unique<PgTransaction>(pool_, PgTransaction::Mode::kSnapshot);
}

PgTransaction& PgSchemaRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgSchemaRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result PgSchemaRepository::EnsureLedger() {
  try {
    auto conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec("CREATE TABLE IF NOT EXISTS migrations (serial_number bigint PRIMARY KEY);");
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgSchemaRepository::Execute(Transaction& t, const std::string& sql) {
  try {
    TX(t).Work().exec(sql);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgSchemaRepository::IsApplied(Transaction& t, int64_t serial_number) {
  try {
    auto res = TX(t).Work().exec_params("SELECT COUNT(*) AS count FROM migrations WHERE serial_number=$1;", serial_number);
    return res[0][0].as<int64_t>() > 0;
  } catch (const pqxx::failure& e) {
    throw util::DatabaseError(e.what());
  }
}

Result PgSchemaRepository::RecordApplied(Transaction& t, int64_t serial_number) {
  try {
    TX(t).Work().exec_params("INSERT INTO migrations VALUES ($1);", serial_number);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<int64_t> PgSchemaRepository::MaxApplied(Transaction& t) {
  try {
    auto res = TX(t).Work().exec("SELECT max(serial_number) FROM migrations;");
    if (res.empty() || res[0][0].is_null()) {
      return std::nullopt;
    }
    return res[0][0].as<int64_t>();
  } catch (const pqxx::failure& e) {
    throw util::DatabaseError(e.what());
  }
}

std::vector<int64_t> PgSchemaRepository::ListApplied(Transaction& t) {
  try {
    auto res = TX(t).Work().exec("SELECT serial_number FROM migrations ORDER BY serial_number ASC;");

    std::vector<int64_t> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(row[0].as<int64_t>());
    }
    return out;
  } catch (const pqxx::failure& e) {
    throw util::DatabaseError(e.what());
  }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

uint64_t PgSchemaRepository::CountEvents(Transaction& t) {
  try {
    auto res = TX(t).Work().exec("SELECT COUNT(*) FROM event;");
    return res[0][0].as<uint64_t>();
  } catch (const pqxx::failure& e) {
    throw util::DatabaseError(e.what());
  }
}

Result PgSchemaRepository::ScanEvents(Transaction& t, std::size_t batch_size, const EventVisitor& visit) {
  if (batch_size == 0) {
    batch_size = 1;
  }

  try {
    auto& work = TX(t).Work();
    work.exec(
        "DECLARE event_scan NO SCROLL CURSOR FOR "
        "SELECT encode(id,'hex'), encode(content,'hex') FROM event ORDER BY id;");

    const std::string fetch = "FETCH FORWARD " + std::to_string(batch_size) + " FROM event_scan;";
    for (;;) {
      auto res = work.exec(fetch);

      for (const auto& row : res) {
        auto id      = util::HexDecode(row[0].c_str());
        auto content = util::HexDecode(row[1].c_str());
        if (!id || !content) {
          return Result::Err(ErrorCode::Corruption, "undecodable event row");
        }

        model::EventRecord e;
        e.id      = std::move(*id);
        e.content = std::move(*content);

        auto visited = visit(e);
        if (!visited) {
          return visited;
        }
      }

      if (res.size() < batch_size) {
        break;
      }
    }

    work.exec("CLOSE event_scan;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgSchemaRepository::InsertEvent(Transaction& t, const model::EventRecord& e) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO \"event\" (id,pub_key,created_at,kind,\"content\",hidden,delegated_by) "
        "VALUES (decode($1,'hex'),decode($2,'hex'),to_timestamp($3),$4,decode($5,'hex'),"
        "CASE WHEN $6::boolean THEN 1::bit(1) ELSE 0::bit(1) END,NULLIF(decode($7,'hex'),''::bytea));",
        util::HexEncode(e.id), util::HexEncode(e.pub_key), e.created_at, e.kind, util::HexEncode(e.content), e.hidden,
        util::HexEncode(e.delegated_by));
    return Result::Ok();
  } catch (const std::exception& ex) {
    return Translate(ex);
  }
}

// ------------------------------------------------------------------
// Tags
// ------------------------------------------------------------------

Result PgSchemaRepository::DeleteAllTags(Transaction& t) {
  return Execute(t, "DELETE FROM tag;");
}

Result PgSchemaRepository::InsertTag(Transaction& t, const model::TagRecord& tag) {
  try {
    if (tag.value_hex) {
      TX(t).Work().exec_params(
          "INSERT INTO tag (event_id, \"name\", value_hex) VALUES (decode($1,'hex'), $2, decode($3,'hex')) ON CONFLICT DO NOTHING;",
          util::HexEncode(tag.event_id), tag.name, util::HexEncode(*tag.value_hex));
    } else {
      TX(t).Work().exec_params(
          "INSERT INTO tag (event_id, \"name\", value) VALUES (decode($1,'hex'), $2, decode($3,'hex')) ON CONFLICT DO NOTHING;",
          util::HexEncode(tag.event_id), tag.name, util::HexEncode(tag.value.value_or(std::string{})));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TagRecord> PgSchemaRepository::ListTags(Transaction& t, const std::string& event_id) {
  try {
    auto res = TX(t).Work().exec_params(
        "SELECT \"name\", encode(value,'hex'), encode(value_hex,'hex') FROM tag WHERE event_id=decode($1,'hex') ORDER BY id ASC;",
        util::HexEncode(event_id));

    std::vector<model::TagRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::TagRecord tag;
      tag.event_id  = event_id;
      tag.name      = row[0].c_str();
      tag.value     = NullableBytes(row[1]);
      tag.value_hex = NullableBytes(row[2]);
      out.push_back(std::move(tag));
    }
    return out;
  } catch (const pqxx::failure& e) {
    throw util::DatabaseError(e.what());
  }
}

} // namespace relaystore::db::postgres
