#pragma once

#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "kinship/graph/v1.hpp"

namespace kinship::graph {

struct FilterCriteria {
  bool living_only = false;

  std::optional<std::string> gender_id;

  std::optional<std::string> country_id;
  std::optional<std::string> state_id;
  std::optional<std::string> district_id;
  std::optional<std::string> sub_district_id;
  std::optional<std::string> locality_id;

  bool HasAddressFilter() const {
    return country_id || state_id || district_id || sub_district_id || locality_id;
  }

  bool Any() const {
    return living_only || gender_id || HasAddressFilter();
  }
};

// Throws util::InvalidFilter when a filter is present but empty.
FilterCriteria CriteriaFromRequest(const kinship::graph::v1::FindRelativesRequest& request);

/*
  Attribute filter applied to discovery survivors.

  Looks persons up through the repository inside the caller's transaction.
  A person whose record (or current address, for address filters) is
  missing fails every active filter.
*/
class RelativeFilter {
 public:
  RelativeFilter(db::Repository& repository, db::Transaction& tx, FilterCriteria criteria);

  bool Active() const {
    return criteria_.Any();
  }

  bool Keep(const std::string& person_id) const;

 private:
  db::Repository& repository_;
  db::Transaction& tx_;
  FilterCriteria   criteria_;
};

} // namespace kinship::graph
