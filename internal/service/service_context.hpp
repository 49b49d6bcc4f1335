#pragma once

#include <memory>

#include "internal/config/graph_settings.hpp"

namespace kinship::db { class Repository; }

namespace kinship::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<kinship::db::Repository> repository;
  kinship::config::GraphSettings           settings;
};

}
