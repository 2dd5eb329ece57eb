#include "internal/model/naming.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/time.hpp"

namespace {

using namespace pgshadow::model;

bool IsValidUtf8(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const auto c   = static_cast<unsigned char>(s[i]);
    std::size_t len = 1;
    if (c >= 0xF0) {
      len = 4;
    } else if (c >= 0xE0) {
      len = 3;
    } else if (c >= 0xC0) {
      len = 2;
    } else if (c >= 0x80) {
      return false;
    }
    if (i + len > s.size()) return false;
    for (std::size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
    }
    i += len;
  }
  return true;
}

void TestArtifactNamesForShortTable() {
  const auto names = DeriveArtifactNames(TableName{"public", "accounts"}, "pgshadow");
  assert(names.shadow.schema == "pgshadow");
  assert(names.shadow.name == "public__accounts");
  assert(names.log.schema == "pgshadow");
  assert(names.log.name == "public__accounts__log");
  assert(names.row_function == "public__accounts__capture");
  assert(names.truncate_function == "public__accounts__capture_trunc");
  assert(names.log_key_index == "public__accounts__log_key");
}

void TestLongNamesStayWithinLimitAndDistinct() {
  const std::string long_a(60, 'a');
  const std::string long_b = std::string(59, 'a') + "b";

  const auto a = DeriveArtifactNames(TableName{"public", long_a}, "pgshadow");
  const auto b = DeriveArtifactNames(TableName{"public", long_b}, "pgshadow");

  for (const auto* n : {&a.shadow.name, &a.log.name, &a.row_function, &a.truncate_function, &a.log_key_index}) {
    assert(n->size() <= kMaxIdentifierLength);
  }
  assert(a.log.name.size() == kMaxIdentifierLength);
  assert(a.log.name.substr(a.log.name.size() - 5) == "__log");
  assert(a.shadow.name != b.shadow.name);
  assert(a.log.name != b.log.name);

  // same input, same output: a restarted process finds the same objects
  const auto again = DeriveArtifactNames(TableName{"public", long_a}, "pgshadow");
  assert(again.log.name == a.log.name);
}

void TestShorteningNeverSplitsMultibyteCharacters() {
  std::string wide;
  for (int i = 0; i < 40; ++i) wide += "\xC3\xA9";  // é

  const auto fitted = FitIdentifier(wide, "__capture_trunc");
  assert(fitted.size() <= kMaxIdentifierLength);
  assert(IsValidUtf8(fitted));
  assert(fitted.substr(fitted.size() - 15) == "__capture_trunc");
}

void TestFitIdentifierLeavesShortNamesAlone() {
  assert(FitIdentifier("orders", "_x") == "orders_x");
  const std::string exact(kMaxIdentifierLength, 'z');
  assert(FitIdentifier(exact) == exact);
}

void TestArchivedNames() {
  const auto at = pgshadow::util::FromUnixMillis(1700000000000ull);  // 2023-11-14 22:13:20 UTC
  const TableName source{"public", "accounts"};

  const auto first = ArchivedName(source, "pgshadow_archive", at);
  assert(first.schema == "pgshadow_archive");
  assert(first.name == "accounts_20231114221320");

  const auto second = ArchivedName(source, "pgshadow_archive", at, 2);
  assert(second.name == "accounts_20231114221320_2");

  const auto long_name = ArchivedName(TableName{"public", std::string(70, 'x')}, "pgshadow_archive", at);
  assert(long_name.name.size() <= kMaxIdentifierLength);
  assert(long_name.name.substr(long_name.name.size() - 15) == "_20231114221320");
}

void TestRegistryTable() {
  const auto table = RegistryTable("pgshadow");
  assert(table.schema == "pgshadow");
  assert(table.name == "migrations");
}

} // namespace

int main() {
  TestArtifactNamesForShortTable();
  TestLongNamesStayWithinLimitAndDistinct();
  TestShorteningNeverSplitsMultibyteCharacters();
  TestFitIdentifierLeavesShortNamesAlone();
  TestArchivedNames();
  TestRegistryTable();

  std::cout << "pgshadow_unit_naming: pass\n";
  return 0;
}
