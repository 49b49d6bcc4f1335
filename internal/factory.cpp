#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if KINSHIP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace kinship::factory {

using kinship::observability::BoolField;
using kinship::observability::IntField;
using kinship::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const kinship::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if KINSHIP_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    if (database.sqlite().bootstrap_schema()) {
      db::sqlite::BootstrapSchema(*sqlite_db);
    }
    KINSHIP_LOG_INFO("using sqlite person store",
                     {StringField("path", database.sqlite().path()), BoolField("bootstrap", database.sqlite().bootstrap_schema())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  KINSHIP_LOG_INFO("using in-memory person store");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const kinship::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildRepository(config));
}

Application Build(const kinship::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  Application app;
  app.settings   = config::GraphSettingsFromConfig(config);
  app.repository = std::move(repository);

  KINSHIP_LOG_DEBUG("graph settings",
                    {IntField("max_depth", app.settings.max_depth),
                     IntField("max_results", app.settings.max_results),
                     IntField("max_hops", app.settings.max_hops),
                     IntField("match_max_depth", app.settings.match_max_depth),
                     BoolField("relatives_scoped_loading", app.settings.relatives_scoped_loading),
                     BoolField("path_scoped_loading", app.settings.path_scoped_loading),
                     BoolField("match_scoped_loading", app.settings.match_scoped_loading)});

  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.settings   = app.settings;

  app.relatives_network_service = std::make_shared<service::RelativesNetworkService>(ctx);
  app.lineage_path_service      = std::make_shared<service::LineagePathService>(ctx);
  app.partner_match_service     = std::make_shared<service::PartnerMatchService>(ctx);

  return app;
}

} // namespace kinship::factory
