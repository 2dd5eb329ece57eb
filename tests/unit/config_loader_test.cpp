#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/config/settings.hpp"
#include "internal/util/errors.hpp"

namespace {

using pgshadow::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "pgshadow_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const pgshadow::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestExampleConfigLoads() {
  auto config = ConfigLoader::LoadFromYaml(PGSHADOW_EXAMPLE_CONFIG);
  assert(config.database().connection_uri() == "postgresql://postgres@localhost:5432/postgres");
  assert(config.database().max_connections() == 4);
  assert(config.migration().work_schema() == "pgshadow");
  assert(config.migration().has_resume() && config.migration().resume());
  assert(config.backfill().chunk_size() == 1000);
  assert(config.cutover().max_attempts() == 5);
  assert(config.retry().max_backoff_ms() == 5000);

  const auto settings = pgshadow::config::ResolveSettings(config);
  assert(settings.replay.batch_size == 500);
  assert(settings.quiescence.window == std::chrono::milliseconds(2000));
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  connection_uri: "host=db\\primary password='p\"w'"
  application_name: "line1\nline2☃"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().connection_uri() == "host=db\\primary password='p\"w'");
  assert(config.database().application_name() == std::string("line1\nline2☃"));
}

void TestQuotedNumbersStayStrings() {
  // an all-digit schema name must not be coerced into a number
  auto config = ConfigLoader::LoadFromYamlString(R"(migration:
  work_schema: "2024"
  archive_schema: "true"
)");
  assert(config.migration().work_schema() == "2024");
  assert(config.migration().archive_schema() == "true");
}

void TestExplicitFalseIsKept() {
  auto config = ConfigLoader::LoadFromYamlString(R"(migration:
  resume: false
)");
  assert(config.migration().has_resume());
  assert(!config.migration().resume());

  const auto settings = pgshadow::config::ResolveSettings(config);
  assert(!settings.migration.resume);
}

void TestEmptyDocumentMeansDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.database().connection_uri().empty());
  assert(!config.migration().has_resume());
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(database:
  connection_uri: "postgresql://localhost/db"
unknown_field: 123
)"));
  assert(Rejects(R"(backfill:
  chunk_sise: 10
)"));
}

void TestRowLockingIsNotConfigurable() {
  // backfill always locks the rows it copies
  assert(Rejects(R"(backfill:
  lock_rows: false
)"));
  assert(Rejects(R"(backfill:
  lock_rows: true
)"));
}

void TestMalformedDocumentsAreRejected() {
  assert(Rejects("- just\n- a list\n"));
  assert(Rejects("database: [unterminated\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/pgshadow.yaml");
  } catch (const pgshadow::util::ConfigError&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must report a missing file as a config error.");
}

} // namespace

int main() {
  TestExampleConfigLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestExplicitFalseIsKept();
  TestEmptyDocumentMeansDefaults();
  TestUnknownFieldsAreRejected();
  TestRowLockingIsNotConfigurable();
  TestMalformedDocumentsAreRejected();

  std::cout << "pgshadow_unit_config_loader: pass\n";
  return 0;
}
