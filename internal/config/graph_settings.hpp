#pragma once

#include <cstdint>

#include "config/config.pb.h"
#include "internal/model/relationship.hpp"

namespace kinship::config {

inline constexpr std::uint32_t kDefaultMaxDepth   = 20;
inline constexpr std::uint32_t kDefaultMaxResults = 100;
inline constexpr std::uint32_t kDefaultMaxHops    = 20;

inline constexpr std::uint32_t kDefaultMatchDepth    = 5;
inline constexpr std::uint32_t kDefaultMatchMaxDepth = 10;

/*
  Resolved limits for the graph services.

  Zero values in the config select the defaults above.
*/
struct GraphSettings {
  std::uint32_t max_depth   = kDefaultMaxDepth;
  std::uint32_t max_results = kDefaultMaxResults;
  std::uint32_t max_hops    = kDefaultMaxHops;

  std::uint32_t match_default_depth = kDefaultMatchDepth;
  std::uint32_t match_max_depth     = kDefaultMatchMaxDepth;

  bool relatives_scoped_loading = true;
  bool path_scoped_loading      = true;
  bool match_scoped_loading     = true;

  model::GenderIds genders;
};

GraphSettings GraphSettingsFromConfig(const kinship::runtime::config::RuntimeConfig& config);

} // namespace kinship::config
