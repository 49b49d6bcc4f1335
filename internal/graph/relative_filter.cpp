#include "internal/graph/relative_filter.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace kinship::graph {

namespace {

void CopyFilter(bool present, const std::string& value, const char* name, std::optional<std::string>& out) {
  if (!present) {
    return;
  }
  if (value.empty()) {
    throw util::InvalidFilter(std::string(name) + " filter must not be empty");
  }
  out = value;
}

bool Matches(const std::optional<std::string>& wanted, const std::string& actual) {
  return !wanted || *wanted == actual;
}

} // namespace

FilterCriteria CriteriaFromRequest(const kinship::graph::v1::FindRelativesRequest& request) {
  FilterCriteria criteria;
  criteria.living_only = request.living_only();

  CopyFilter(request.has_gender_id(), request.gender_id(), "gender_id", criteria.gender_id);

  const auto& address = request.address();
  CopyFilter(address.has_country_id(), address.country_id(), "country_id", criteria.country_id);
  CopyFilter(address.has_state_id(), address.state_id(), "state_id", criteria.state_id);
  CopyFilter(address.has_district_id(), address.district_id(), "district_id", criteria.district_id);
  CopyFilter(address.has_sub_district_id(), address.sub_district_id(), "sub_district_id", criteria.sub_district_id);
  CopyFilter(address.has_locality_id(), address.locality_id(), "locality_id", criteria.locality_id);

  return criteria;
}

RelativeFilter::RelativeFilter(db::Repository& repository, db::Transaction& tx, FilterCriteria criteria)
    : repository_(repository), tx_(tx), criteria_(std::move(criteria)) {
}

bool RelativeFilter::Keep(const std::string& person_id) const {
  if (!Active()) {
    return true;
  }

  if (criteria_.living_only || criteria_.gender_id) {
    const auto person = repository_.LookupPerson(tx_, person_id);
    if (!person) {
      return false;
    }
    if (criteria_.living_only && !person->date_of_death.empty()) {
      return false;
    }
    if (!Matches(criteria_.gender_id, person->gender_id)) {
      return false;
    }
  }

  if (criteria_.HasAddressFilter()) {
    const auto address = repository_.LookupCurrentAddress(tx_, person_id);
    if (!address) {
      return false;
    }
    return Matches(criteria_.country_id, address->country_id) && Matches(criteria_.state_id, address->state_id) &&
           Matches(criteria_.district_id, address->district_id) &&
           Matches(criteria_.sub_district_id, address->sub_district_id) &&
           Matches(criteria_.locality_id, address->locality_id);
  }

  return true;
}

} // namespace kinship::graph
