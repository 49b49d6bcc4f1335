#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/graph_settings.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "kinship_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "%v"
database:
  sqlite:
    path: "/var/lib/kinship/people.db"
    bootstrap_schema: true
relatives_network:
  max_depth: 8
  max_results: 25
  scoped_loading: false
lineage_path:
  max_hops: 12
partner_match:
  default_depth: 3
  max_depth: 6
  scoped_loading: false
genders:
  male_id: "m-1"
  female_id: "f-1"
)");

  auto config = kinship::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/kinship/people.db");
  assert(config.database().sqlite().bootstrap_schema());

  auto settings = kinship::config::GraphSettingsFromConfig(config);
  assert(settings.max_depth == 8);
  assert(settings.max_results == 25);
  assert(settings.max_hops == 12);
  assert(!settings.relatives_scoped_loading);
  assert(settings.path_scoped_loading);
  assert(settings.match_default_depth == 3);
  assert(settings.match_max_depth == 6);
  assert(!settings.match_scoped_loading);
  assert(settings.genders.male_id == "m-1");
  assert(settings.genders.female_id == "f-1");
}

void TestDefaultsApplyToMissingAndZeroValues() {
  auto config = kinship::config::ConfigLoader::LoadFromString(R"(database:
  memory: {}
relatives_network:
  max_depth: 0
)");
  assert(config.database().has_memory());

  auto settings = kinship::config::GraphSettingsFromConfig(config);
  assert(settings.max_depth == kinship::config::kDefaultMaxDepth);
  assert(settings.max_results == kinship::config::kDefaultMaxResults);
  assert(settings.max_hops == kinship::config::kDefaultMaxHops);
  assert(settings.relatives_scoped_loading);
  assert(settings.path_scoped_loading);
  assert(settings.match_default_depth == kinship::config::kDefaultMatchDepth);
  assert(settings.match_max_depth == kinship::config::kDefaultMatchMaxDepth);
  assert(settings.match_scoped_loading);
  assert(settings.genders.male_id == kinship::model::kDefaultMaleGenderId);
  assert(settings.genders.female_id == kinship::model::kDefaultFemaleGenderId);

  auto empty = kinship::config::ConfigLoader::LoadFromString("");
  assert(!empty.database().has_sqlite());
  assert(!empty.database().has_memory());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\kinship\\\"quoted\"\\db.sqlite"
)");

  auto config = kinship::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\kinship\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(relatives_network:
  max_depth: 5
  unknown_field: 123
)");

  bool threw = false;
  try {
    (void)kinship::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)kinship::config::ConfigLoader::LoadFromYaml("/nonexistent/kinship/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsApplyToMissingAndZeroValues();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "kinship_unit_config_loader: pass\n";
  return 0;
}
