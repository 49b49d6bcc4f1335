#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/config/graph_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/lineage_path_service.hpp"
#include "internal/service/partner_match_service.hpp"
#include "internal/service/relatives_network_service.hpp"

namespace kinship::factory {

/*
  Application

  Owns the long-lived objects behind the query services.
*/
struct Application {
  config::GraphSettings settings;

  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<service::RelativesNetworkService> relatives_network_service;
  std::shared_ptr<service::LineagePathService>      lineage_path_service;
  std::shared_ptr<service::PartnerMatchService>     partner_match_service;
};

/*
  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const kinship::runtime::config::RuntimeConfig& config);

Application Build(const kinship::runtime::config::RuntimeConfig& config);

// Wires services over an existing repository.
Application Build(const kinship::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

} // namespace kinship::factory
