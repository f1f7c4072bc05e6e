#include "internal/migration/registry.hpp"

#include <stdexcept>
#include <string>

namespace relaystore::migration {
namespace {

// ------------------------------------------------------------------
// PostgreSQL
// ------------------------------------------------------------------

std::vector<MigrationDescriptor> BuildPostgresMigrations() {
  std::vector<MigrationDescriptor> m;

  m.push_back({1, "event, tag and user_verification tables",
               SqlMigration{{
                   R"(CREATE TABLE "event" (
  id bytea NOT NULL,
  pub_key bytea NOT NULL,
  created_at timestamp with time zone NOT NULL,
  kind integer NOT NULL,
  "content" bytea NOT NULL,
  hidden bit(1) NOT NULL DEFAULT 0::bit(1),
  delegated_by bytea NULL,
  first_seen timestamp with time zone NOT NULL DEFAULT now(),
  CONSTRAINT event_pkey PRIMARY KEY (id)
);)",
                   R"(CREATE INDEX event_created_at_idx ON "event" (created_at,kind);)",
                   R"(CREATE INDEX event_pub_key_idx ON "event" (pub_key);)",
                   R"(CREATE INDEX event_delegated_by_idx ON "event" (delegated_by);)",
                   R"(CREATE TABLE "tag" (
  id int8 NOT NULL GENERATED BY DEFAULT AS IDENTITY,
  event_id bytea NOT NULL,
  "name" varchar NOT NULL,
  value bytea NOT NULL,
  CONSTRAINT tag_fk FOREIGN KEY (event_id) REFERENCES "event"(id) ON DELETE CASCADE
);)",
                   R"(CREATE INDEX tag_event_id_idx ON tag USING btree (event_id, name);)",
                   R"(CREATE INDEX tag_value_idx ON tag USING btree (value);)",
                   R"(CREATE TABLE "user_verification" (
  id int8 NOT NULL GENERATED BY DEFAULT AS IDENTITY,
  event_id bytea NOT NULL,
  "name" varchar NOT NULL,
  verified_at timestamptz NULL,
  failed_at timestamptz NULL,
  fail_count int4 NULL DEFAULT 0,
  CONSTRAINT user_verification_pk PRIMARY KEY (id),
  CONSTRAINT user_verification_fk FOREIGN KEY (event_id) REFERENCES "event"(id) ON DELETE CASCADE
);)",
                   R"(CREATE INDEX user_verification_event_id_idx ON user_verification USING btree (event_id);)",
                   R"(CREATE INDEX user_verification_name_idx ON user_verification USING btree (name);)",
               }}});

  m.push_back({2, "hex-packed tag values",
               DataTransformMigration{{
                                          R"(ALTER TABLE tag ADD COLUMN value_hex bytea;)",
                                          R"(ALTER TABLE tag ALTER COLUMN value DROP NOT NULL;)",
                                          R"(CREATE INDEX tag_value_hex_idx ON tag USING btree (value_hex);)",
                                      },
                                      Backfill::kRebuildTags}});

  m.push_back({3, "unique tag rows",
               SqlMigration{{
                   R"(ALTER TABLE tag ADD CONSTRAINT unique_constraint_name UNIQUE (event_id, "name", value);)",
               }}});

  m.push_back({4, "account and invoice tables",
               SqlMigration{{
                   R"(CREATE TABLE "account" (
  pubkey varchar NOT NULL,
  is_admitted BOOLEAN NOT NULL DEFAULT FALSE,
  balance BIGINT NOT NULL DEFAULT 0,
  tos_accepted_at TIMESTAMP,
  CONSTRAINT account_pkey PRIMARY KEY (pubkey)
);)",
                   R"(CREATE TYPE status AS ENUM ('Paid', 'Unpaid', 'Expired');)",
                   R"(CREATE TABLE "invoice" (
  payment_hash varchar NOT NULL,
  pubkey varchar NOT NULL,
  amount BIGINT NOT NULL,
  status status NOT NULL DEFAULT 'Unpaid',
  description varchar,
  confirmed_at timestamp,
  created_at timestamp,
  invoice varchar,
  CONSTRAINT invoice_payment_hash PRIMARY KEY (payment_hash),
  CONSTRAINT invoice_pubkey_fkey FOREIGN KEY (pubkey) REFERENCES account (pubkey) ON DELETE CASCADE
);)",
               }}});

  return m;
}

// ------------------------------------------------------------------
// SQLite
//
// No ALTER COLUMN, ADD CONSTRAINT or enum types: migration 2 rebuilds
// the tag table, 3 uses a unique index, 4 a CHECK constraint.
// ------------------------------------------------------------------

std::vector<MigrationDescriptor> BuildSqliteMigrations() {
  std::vector<MigrationDescriptor> m;

  m.push_back({1, "event, tag and user_verification tables",
               SqlMigration{{
                   R"(CREATE TABLE event (
  id BLOB NOT NULL,
  pub_key BLOB NOT NULL,
  created_at INTEGER NOT NULL,
  kind INTEGER NOT NULL,
  content BLOB NOT NULL,
  hidden INTEGER NOT NULL DEFAULT 0,
  delegated_by BLOB NULL,
  first_seen INTEGER NOT NULL DEFAULT (strftime('%s','now')),
  CONSTRAINT event_pkey PRIMARY KEY (id)
);)",
                   R"(CREATE INDEX event_created_at_idx ON event (created_at, kind);)",
                   R"(CREATE INDEX event_pub_key_idx ON event (pub_key);)",
                   R"(CREATE INDEX event_delegated_by_idx ON event (delegated_by);)",
                   R"(CREATE TABLE tag (
  id INTEGER PRIMARY KEY,
  event_id BLOB NOT NULL,
  name TEXT NOT NULL,
  value BLOB NOT NULL,
  CONSTRAINT tag_fk FOREIGN KEY (event_id) REFERENCES event(id) ON DELETE CASCADE
);)",
                   R"(CREATE INDEX tag_event_id_idx ON tag (event_id, name);)",
                   R"(CREATE INDEX tag_value_idx ON tag (value);)",
                   R"(CREATE TABLE user_verification (
  id INTEGER PRIMARY KEY,
  event_id BLOB NOT NULL,
  name TEXT NOT NULL,
  verified_at INTEGER NULL,
  failed_at INTEGER NULL,
  fail_count INTEGER NULL DEFAULT 0,
  CONSTRAINT user_verification_fk FOREIGN KEY (event_id) REFERENCES event(id) ON DELETE CASCADE
);)",
                   R"(CREATE INDEX user_verification_event_id_idx ON user_verification (event_id);)",
                   R"(CREATE INDEX user_verification_name_idx ON user_verification (name);)",
               }}});

  m.push_back({2, "hex-packed tag values",
               DataTransformMigration{{
                                          R"(CREATE TABLE tag_rebuild (
  id INTEGER PRIMARY KEY,
  event_id BLOB NOT NULL,
  name TEXT NOT NULL,
  value BLOB NULL,
  value_hex BLOB NULL,
  CONSTRAINT tag_fk FOREIGN KEY (event_id) REFERENCES event(id) ON DELETE CASCADE
);)",
                                          R"(INSERT INTO tag_rebuild (id, event_id, name, value) SELECT id, event_id, name, value FROM tag;)",
                                          R"(DROP TABLE tag;)",
                                          R"(ALTER TABLE tag_rebuild RENAME TO tag;)",
                                          R"(CREATE INDEX tag_event_id_idx ON tag (event_id, name);)",
                                          R"(CREATE INDEX tag_value_idx ON tag (value);)",
                                          R"(CREATE INDEX tag_value_hex_idx ON tag (value_hex);)",
                                      },
                                      Backfill::kRebuildTags}});

  m.push_back({3, "unique tag rows",
               SqlMigration{{
                   R"(CREATE UNIQUE INDEX unique_constraint_name ON tag (event_id, name, value);)",
               }}});

  m.push_back({4, "account and invoice tables",
               SqlMigration{{
                   R"(CREATE TABLE account (
  pubkey TEXT NOT NULL,
  is_admitted INTEGER NOT NULL DEFAULT 0,
  balance INTEGER NOT NULL DEFAULT 0,
  tos_accepted_at INTEGER,
  CONSTRAINT account_pkey PRIMARY KEY (pubkey)
);)",
                   R"(CREATE TABLE invoice (
  payment_hash TEXT NOT NULL,
  pubkey TEXT NOT NULL,
  amount INTEGER NOT NULL,
  status TEXT NOT NULL DEFAULT 'Unpaid' CHECK (status IN ('Paid', 'Unpaid', 'Expired')),
  description TEXT,
  confirmed_at INTEGER,
  created_at INTEGER,
  invoice TEXT,
  CONSTRAINT invoice_payment_hash PRIMARY KEY (payment_hash),
  CONSTRAINT invoice_pubkey_fkey FOREIGN KEY (pubkey) REFERENCES account (pubkey) ON DELETE CASCADE
);)",
               }}});

  return m;
}

} // namespace

const std::vector<MigrationDescriptor>& Migrations(db::Dialect dialect) {
  static const std::vector<MigrationDescriptor> kPostgres = [] {
    auto m = BuildPostgresMigrations();
    ValidateRegistry(m);
    return m;
  }();
  static const std::vector<MigrationDescriptor> kSqlite = [] {
    auto m = BuildSqliteMigrations();
    ValidateRegistry(m);
    return m;
  }();

  switch (dialect) {
    case db::Dialect::kPostgres:
      return kPostgres;
    case db::Dialect::kSqlite:
      return kSqlite;
  }
  throw std::invalid_argument("no migration catalog for dialect");
}

void ValidateRegistry(const std::vector<MigrationDescriptor>& migrations) {
  int64_t previous = 0;
  for (const auto& m : migrations) {
    if (m.serial_number <= 0) {
      throw std::invalid_argument("migration serial numbers must be positive, got " + std::to_string(m.serial_number));
    }
    if (m.serial_number <= previous) {
      throw std::invalid_argument("migration " + std::to_string(m.serial_number) + " is out of order after " + std::to_string(previous));
    }
    if (m.Statements().empty()) {
      throw std::invalid_argument("migration " + std::to_string(m.serial_number) + " has no statements");
    }
    previous = m.serial_number;
  }
}

int64_t LatestVersion(const std::vector<MigrationDescriptor>& migrations) {
  return migrations.empty() ? 0 : migrations.back().serial_number;
}

} // namespace relaystore::migration
