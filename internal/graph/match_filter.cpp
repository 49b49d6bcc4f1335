#include "internal/graph/match_filter.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace kinship::graph {

using kinship::observability::StringField;
using namespace kinship::graph::v1;

namespace {

bool Contains(const std::vector<std::string>& ids, const std::string& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

// Empty list admits everyone; otherwise the id must be present and listed.
bool Included(const std::vector<std::string>& wanted, const std::string& actual) {
  return wanted.empty() || (!actual.empty() && Contains(wanted, actual));
}

bool IsParent(model::RelationshipKind kind) {
  return kind == RELATIONSHIP_KIND_FATHER || kind == RELATIONSHIP_KIND_MOTHER || kind == RELATIONSHIP_KIND_PARENT;
}

bool IsChild(model::RelationshipKind kind) {
  return kind == RELATIONSHIP_KIND_SON || kind == RELATIONSHIP_KIND_DAUGHTER || kind == RELATIONSHIP_KIND_CHILD;
}

bool IsSpouse(model::RelationshipKind kind) {
  return kind == RELATIONSHIP_KIND_WIFE || kind == RELATIONSHIP_KIND_HUSBAND || kind == RELATIONSHIP_KIND_SPOUSE;
}

} // namespace

MatchCriteria MatchCriteriaFromRequest(const PartnerMatchRequest& request) {
  MatchCriteria criteria;

  const auto gender = model::ParseGenderCode(request.target_gender());
  if (!gender) {
    throw util::InvalidArgument("target_gender must be MALE or FEMALE, got '" + request.target_gender() + "'");
  }
  criteria.target_gender = *gender;

  if (request.has_birth_year_min()) criteria.birth_year_min = request.birth_year_min();
  if (request.has_birth_year_max()) criteria.birth_year_max = request.birth_year_max();
  if (criteria.birth_year_min && criteria.birth_year_max && *criteria.birth_year_min > *criteria.birth_year_max) {
    throw util::InvalidArgument("birth_year_min must not exceed birth_year_max");
  }

  criteria.include_religion_ids.assign(request.include_religion_ids().begin(), request.include_religion_ids().end());
  criteria.include_category_ids.assign(request.include_category_ids().begin(), request.include_category_ids().end());
  criteria.include_sub_category_ids.assign(request.include_sub_category_ids().begin(),
                                           request.include_sub_category_ids().end());
  criteria.exclude_sub_category_ids.assign(request.exclude_sub_category_ids().begin(),
                                           request.exclude_sub_category_ids().end());
  return criteria;
}

std::unordered_set<std::string> CloseFamily(const AdjacencyView& view, const std::string& seeker_id) {
  std::unordered_set<std::string> close;
  for (const auto& neighbor : view.NeighborsOf(seeker_id)) {
    close.insert(neighbor.id);
    if (!IsParent(neighbor.kind)) {
      continue;
    }
    for (const auto& sibling : view.NeighborsOf(neighbor.id)) {
      if (sibling.id != seeker_id && IsChild(sibling.kind)) {
        close.insert(sibling.id);
      }
    }
  }
  return close;
}

MatchFilter::MatchFilter(db::Repository& repository, db::Transaction& tx, MatchCriteria criteria, model::GenderIds genders)
    : repository_(repository), tx_(tx), criteria_(std::move(criteria)), genders_(std::move(genders)) {
}

bool MatchFilter::Eligible(const std::string& person_id) const {
  const auto person = repository_.LookupPerson(tx_, person_id);
  if (!person) {
    return false;
  }
  if (model::ResolveGender(person->gender_id, genders_) != criteria_.target_gender) {
    return false;
  }
  if (!person->date_of_death.empty()) {
    return false;
  }

  // Unknown birth year never matches.
  const auto born = util::ParseIsoDate(person->date_of_birth);
  if (!born) {
    return false;
  }
  const int birth_year = static_cast<int>(born->year());
  if (criteria_.birth_year_min && birth_year < *criteria_.birth_year_min) {
    return false;
  }
  if (criteria_.birth_year_max && birth_year > *criteria_.birth_year_max) {
    return false;
  }

  if (criteria_.HasReligionFilter() && !PassesReligion(person_id)) {
    return false;
  }

  switch (model::ParseMaritalStatus(person->marital_status)) {
    case model::MaritalStatus::kMarried:
      return false;
    case model::MaritalStatus::kUnknown:
      return !HasSpouseOrChild(person_id);
    default:
      return true;
  }
}

bool MatchFilter::PassesReligion(const std::string& person_id) const {
  const auto religion = repository_.LookupReligion(tx_, person_id).value_or(db::model::ReligionRecord{});

  if (!Included(criteria_.include_religion_ids, religion.religion_id)) return false;
  if (!Included(criteria_.include_category_ids, religion.category_id)) return false;
  if (!Included(criteria_.include_sub_category_ids, religion.sub_category_id)) return false;

  return religion.sub_category_id.empty() || !Contains(criteria_.exclude_sub_category_ids, religion.sub_category_id);
}

bool MatchFilter::HasSpouseOrChild(const std::string& person_id) const {
  for (const auto& edge : repository_.LoadEdgesTouching(tx_, person_id)) {
    if (edge.person_id == edge.related_person_id) {
      continue;
    }
    const auto kind = model::ParseRelationshipKind(edge.relationship_type);
    if (!kind) {
      KINSHIP_LOG_DEBUG("ignoring relationship with unknown type",
                        {StringField("edge_id", edge.id), StringField("type", edge.relationship_type)});
      continue;
    }

    // Read the edge from the candidate's side.
    const auto seen = edge.person_id == person_id ? *kind : model::InverseKind(*kind, model::Gender::kUnknown);
    if (IsSpouse(seen) || IsChild(seen)) {
      return true;
    }
  }
  return false;
}

} // namespace kinship::graph
