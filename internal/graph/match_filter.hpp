#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/adjacency_view.hpp"
#include "internal/model/relationship.hpp"
#include "kinship/graph/v1.hpp"

namespace kinship::graph {

struct MatchCriteria {
  model::Gender target_gender = model::Gender::kUnknown;

  std::optional<int> birth_year_min;
  std::optional<int> birth_year_max;

  std::vector<std::string> include_religion_ids;
  std::vector<std::string> include_category_ids;
  std::vector<std::string> include_sub_category_ids;
  std::vector<std::string> exclude_sub_category_ids;

  bool HasReligionFilter() const {
    return !include_religion_ids.empty() || !include_category_ids.empty() || !include_sub_category_ids.empty() ||
           !exclude_sub_category_ids.empty();
  }
};

// Throws util::InvalidArgument for an unknown gender code or birth_year_min > birth_year_max.
MatchCriteria MatchCriteriaFromRequest(const kinship::graph::v1::PartnerMatchRequest& request);

/*
  Persons too close to the seeker to be proposed: every direct neighbor
  and every other child of the seeker's parents.
*/
std::unordered_set<std::string> CloseFamily(const AdjacencyView& view, const std::string& seeker_id);

/*
  Partner eligibility of one reachable person.

  Checked in order: record exists, gender, alive, birth year known and in
  range, religion filters, marital status. A recorded status decides on
  its own (only married is ineligible). An unknown status falls back to
  the person's stored relationships: any spouse or child means ineligible.
*/
class MatchFilter {
 public:
  MatchFilter(db::Repository& repository, db::Transaction& tx, MatchCriteria criteria, model::GenderIds genders);

  bool Eligible(const std::string& person_id) const;

 private:
  bool PassesReligion(const std::string& person_id) const;
  bool HasSpouseOrChild(const std::string& person_id) const;

  db::Repository&  repository_;
  db::Transaction& tx_;
  MatchCriteria    criteria_;
  model::GenderIds genders_;
};

} // namespace kinship::graph
