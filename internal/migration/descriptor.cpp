#include "internal/migration/descriptor.hpp"

namespace relaystore::migration {

const char* BackfillName(Backfill backfill) {
  switch (backfill) {
    case Backfill::kRebuildTags:
      return "rebuild_tags";
  }
  return "unknown";
}

const std::vector<std::string>& MigrationDescriptor::Statements() const {
  return std::visit([](const auto& b) -> const std::vector<std::string>& { return b.statements; }, body);
}

std::optional<Backfill> MigrationDescriptor::RequiredBackfill() const {
  if (const auto* transform = std::get_if<DataTransformMigration>(&body)) {
    return transform->backfill;
  }
  return std::nullopt;
}

} // namespace relaystore::migration
