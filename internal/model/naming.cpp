#include "naming.hpp"

#include <cstdint>
#include <cstdio>

namespace pgshadow::model {

namespace {

uint32_t Fnv1a(std::string_view text) {
  uint32_t hash = 2166136261u;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= 16777619u;
  }
  return hash;
}

} // namespace

std::string FitIdentifier(std::string_view base, std::string_view suffix) {
  if (base.size() + suffix.size() <= kMaxIdentifierLength) {
    std::string out(base);
    out.append(suffix);
    return out;
  }

  char hash[10];
  std::snprintf(hash, sizeof(hash), "_%08x", Fnv1a(base));

  const std::size_t keep = kMaxIdentifierLength - suffix.size() - (sizeof(hash) - 1);
  std::string       out(base.substr(0, keep));
  // never leave half of a multibyte character behind
  std::size_t lead = out.size();
  while (lead > 0 && (static_cast<unsigned char>(out[lead - 1]) & 0xC0) == 0x80) {
    --lead;
  }
  if (lead > 0 && (static_cast<unsigned char>(out[lead - 1]) & 0x80) != 0) {
    const auto        c    = static_cast<unsigned char>(out[lead - 1]);
    const std::size_t need = c >= 0xF0 ? 4 : c >= 0xE0 ? 3 : 2;
    if (out.size() - (lead - 1) < need) {
      out.resize(lead - 1);
    }
  }
  out.append(hash);
  out.append(suffix);
  return out;
}

ArtifactNames DeriveArtifactNames(const TableName& source, std::string_view work_schema) {
  const std::string stem = source.schema + "__" + source.name;

  ArtifactNames names;
  names.shadow            = TableName{std::string(work_schema), FitIdentifier(stem)};
  names.log               = TableName{std::string(work_schema), FitIdentifier(stem, "__log")};
  names.row_function      = FitIdentifier(stem, "__capture");
  names.truncate_function = FitIdentifier(stem, "__capture_trunc");
  names.log_key_index     = FitIdentifier(stem, "__log_key");
  return names;
}

TableName RegistryTable(std::string_view work_schema) {
  return TableName{std::string(work_schema), std::string(kRegistryTable)};
}

TableName ArchivedName(const TableName& source, std::string_view archive_schema, util::TimePoint at, int collision) {
  std::string suffix = "_" + util::CompactUtcStamp(at);
  if (collision > 0) {
    suffix += "_" + std::to_string(collision);
  }
  return TableName{std::string(archive_schema), FitIdentifier(source.name, suffix)};
}

} // namespace pgshadow::model
