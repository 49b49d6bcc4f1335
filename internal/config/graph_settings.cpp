#include "internal/config/graph_settings.hpp"

namespace kinship::config {

GraphSettings GraphSettingsFromConfig(const kinship::runtime::config::RuntimeConfig& config) {
  GraphSettings settings;

  const auto& relatives = config.relatives_network();
  if (relatives.max_depth() > 0) {
    settings.max_depth = relatives.max_depth();
  }
  if (relatives.max_results() > 0) {
    settings.max_results = relatives.max_results();
  }
  if (relatives.has_scoped_loading()) {
    settings.relatives_scoped_loading = relatives.scoped_loading();
  }

  const auto& path = config.lineage_path();
  if (path.max_hops() > 0) {
    settings.max_hops = path.max_hops();
  }
  if (path.has_scoped_loading()) {
    settings.path_scoped_loading = path.scoped_loading();
  }

  const auto& match = config.partner_match();
  if (match.max_depth() > 0) {
    settings.match_max_depth = match.max_depth();
  }
  if (match.default_depth() > 0) {
    settings.match_default_depth = match.default_depth();
  }
  if (match.has_scoped_loading()) {
    settings.match_scoped_loading = match.scoped_loading();
  }

  if (!config.genders().male_id().empty()) {
    settings.genders.male_id = config.genders().male_id();
  }
  if (!config.genders().female_id().empty()) {
    settings.genders.female_id = config.genders().female_id();
  }

  return settings;
}

} // namespace kinship::config
