#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "kinship/graph/v1.hpp"

using namespace kinship::graph::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  kinshipctl --config <config.yaml> relatives <person_id> [options]\n"
            << "      --depth <n>              hops to search (default 1)\n"
            << "      --mode up_to|only_at     depth mode (default up_to)\n"
            << "      --living-only            skip deceased relatives\n"
            << "      --gender <gender_id>\n"
            << "      --country <id> --state <id> --district <id>\n"
            << "      --sub-district <id> --locality <id>\n"
            << "  kinshipctl --config <config.yaml> path <person_a_id> <person_b_id>\n"
            << "  kinshipctl --config <config.yaml> match <seeker_id> <MALE|FEMALE> [options]\n"
            << "      --depth <n>              hops to search (default from config)\n"
            << "      --birth-year-min <y> --birth-year-max <y>\n"
            << "      --religion <id> --category <id> --sub-category <id>   (repeatable)\n"
            << "      --exclude-sub-category <id>                           (repeatable)\n"
            << "      --full-graph             keep every visited person in the graph\n";
}

static std::optional<DepthMode> ParseDepthMode(const std::string& value) {
  if (value == "up_to") {
    return DEPTH_MODE_UP_TO;
  }
  if (value == "only_at") {
    return DEPTH_MODE_ONLY_AT;
  }
  return std::nullopt;
}

static std::optional<std::uint32_t> ParseDepth(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 9) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(std::stoul(value));
}

// Fills req from argv[first..argc). Returns false on a usage error.
static bool ParseRelativesOptions(int argc, char** argv, int first, FindRelativesRequest& req) {
  req.set_depth(1);
  req.set_depth_mode(DEPTH_MODE_UP_TO);

  for (int i = first; i < argc; ++i) {
    const std::string flag = argv[i];

    if (flag == "--living-only") {
      req.set_living_only(true);
      continue;
    }

    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n";
      return false;
    }
    const std::string value = argv[++i];

    if (flag == "--depth") {
      auto depth = ParseDepth(value);
      if (!depth.has_value()) {
        std::cerr << "invalid depth: " << value << "\n";
        return false;
      }
      req.set_depth(depth.value());
    } else if (flag == "--mode") {
      auto mode = ParseDepthMode(value);
      if (!mode.has_value()) {
        std::cerr << "unsupported depth mode: " << value << "\n";
        return false;
      }
      req.set_depth_mode(mode.value());
    } else if (flag == "--gender") {
      req.set_gender_id(value);
    } else if (flag == "--country") {
      req.mutable_address()->set_country_id(value);
    } else if (flag == "--state") {
      req.mutable_address()->set_state_id(value);
    } else if (flag == "--district") {
      req.mutable_address()->set_district_id(value);
    } else if (flag == "--sub-district") {
      req.mutable_address()->set_sub_district_id(value);
    } else if (flag == "--locality") {
      req.mutable_address()->set_locality_id(value);
    } else {
      std::cerr << "unknown option: " << flag << "\n";
      return false;
    }
  }
  return true;
}

// Same as ParseRelativesOptions, for the match subcommand.
static bool ParseMatchOptions(int argc, char** argv, int first, PartnerMatchRequest& req) {
  for (int i = first; i < argc; ++i) {
    const std::string flag = argv[i];

    if (flag == "--full-graph") {
      req.set_prune_graph(false);
      continue;
    }

    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n";
      return false;
    }
    const std::string value = argv[++i];

    if (flag == "--depth" || flag == "--birth-year-min" || flag == "--birth-year-max") {
      auto number = ParseDepth(value);
      if (!number.has_value()) {
        std::cerr << "invalid value for " << flag << ": " << value << "\n";
        return false;
      }
      if (flag == "--depth") {
        req.set_max_depth(number.value());
      } else if (flag == "--birth-year-min") {
        req.set_birth_year_min(static_cast<std::int32_t>(number.value()));
      } else {
        req.set_birth_year_max(static_cast<std::int32_t>(number.value()));
      }
    } else if (flag == "--religion") {
      req.add_include_religion_ids(value);
    } else if (flag == "--category") {
      req.add_include_category_ids(value);
    } else if (flag == "--sub-category") {
      req.add_include_sub_category_ids(value);
    } else if (flag == "--exclude-sub-category") {
      req.add_exclude_sub_category_ids(value);
    } else {
      std::cerr << "unknown option: " << flag << "\n";
      return false;
    }
  }
  return true;
}

static int PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return 2;
  }

  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  FindRelativesRequest relatives_req;
  FindPathRequest      path_req;
  PartnerMatchRequest  match_req;

  if (cmd == "relatives") {
    if (argc < 5) {
      Usage();
      return 1;
    }
    relatives_req.set_person_id(argv[4]);
    if (!ParseRelativesOptions(argc, argv, 5, relatives_req)) {
      return 1;
    }
  } else if (cmd == "path") {
    if (argc != 6) {
      Usage();
      return 1;
    }
    path_req.set_person_a_id(argv[4]);
    path_req.set_person_b_id(argv[5]);
  } else if (cmd == "match") {
    if (argc < 6) {
      Usage();
      return 1;
    }
    match_req.set_seeker_person_id(argv[4]);
    match_req.set_target_gender(argv[5]);
    if (!ParseMatchOptions(argc, argv, 6, match_req)) {
      return 1;
    }
  } else {
    Usage();
    return 1;
  }

  try {
    auto config = kinship::config::ConfigLoader::LoadFromYaml(config_path);
    kinship::observability::InitializeLogging(config);

    auto app = kinship::factory::Build(config);

    int rc = 0;
    if (cmd == "relatives") {
      rc = PrintJson(app.relatives_network_service->FindRelatives(relatives_req));
    } else if (cmd == "path") {
      rc = PrintJson(app.lineage_path_service->FindPath(path_req));
    } else {
      rc = PrintJson(app.partner_match_service->FindMatches(match_req));
    }

    kinship::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    const auto error_class = kinship::util::Classify(e);
    std::cerr << kinship::util::ToString(error_class) << " error: " << e.what() << "\n";
    kinship::observability::ShutdownLogging();
    return error_class == kinship::util::ErrorClass::kClient ? 1 : 2;
  }
}
