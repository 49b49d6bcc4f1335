#include "internal/graph/match_filter.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/family_fixture.hpp"

namespace {

using kinship::db::memory::MemoryRepository;
using kinship::graph::AdjacencyView;
using kinship::graph::CloseFamily;
using kinship::graph::MatchCriteria;
using kinship::graph::MatchCriteriaFromRequest;
using kinship::graph::MatchFilter;
using kinship::model::Gender;
using kinship::model::GenderIds;
using namespace kinship::graph::v1;

AdjacencyView FixtureView(MemoryRepository& repo) {
  auto tx = repo.Begin();
  kinship::graph::GenderIndex genders;
  for (const auto& edge : repo.LoadAllEdges(*tx)) {
    genders[edge.person_id] = kinship::model::ResolveGender(repo.LookupPerson(*tx, edge.person_id)->gender_id, GenderIds{});
  }
  return AdjacencyView::Build(repo.LoadAllEdges(*tx), genders);
}

MatchCriteria Target(Gender gender) {
  MatchCriteria criteria;
  criteria.target_gender = gender;
  return criteria;
}

void TestCloseFamilyCoversNeighborsAndSiblings() {
  MemoryRepository repo;
  kinship::testing::FamilyFixture().SeedInto(repo);
  auto view = FixtureView(repo);

  assert((CloseFamily(view, "priya") == std::unordered_set<std::string>{"vikram", "arjun"}));
  assert((CloseFamily(view, "vikram") ==
          std::unordered_set<std::string>{"mohan", "kamala", "lakshmi", "arjun", "priya", "sunita"}));
  assert((CloseFamily(view, "rahul") == std::unordered_set<std::string>{"sunita"}));
  assert(CloseFamily(view, "hermit").empty());
}

void TestEligibilityChecksPersonAttributes() {
  MemoryRepository repo;
  kinship::testing::FamilyFixture().SeedInto(repo);
  auto tx = repo.Begin();

  MatchFilter male(repo, *tx, Target(Gender::kMale), GenderIds{});
  assert(male.Eligible("rahul"));
  assert(!male.Eligible("priya"));   // gender
  assert(!male.Eligible("mohan"));   // deceased
  assert(!male.Eligible("vikram"));  // has wife and children
  assert(!male.Eligible("ghost"));   // no record

  auto bounded           = Target(Gender::kMale);
  bounded.birth_year_min = 1990;
  bounded.birth_year_max = 1994;
  MatchFilter in_range(repo, *tx, bounded, GenderIds{});
  assert(!in_range.Eligible("rahul"));
  assert(!in_range.Eligible("hermit"));
}

void TestMaritalStatusOverridesRelationships() {
  kinship::testing::FamilyFixture fixture;
  fixture.SetMaritalStatus("kamala", "widowed");
  fixture.SetMaritalStatus("priya", "married");
  fixture.SetMaritalStatus("uma", "unknown");
  MemoryRepository repo;
  fixture.SeedInto(repo);
  auto tx = repo.Begin();

  MatchFilter female(repo, *tx, Target(Gender::kFemale), GenderIds{});
  assert(female.Eligible("kamala"));  // widowed, despite the stored wife edge
  assert(!female.Eligible("priya"));  // married, despite no spouse edge
  assert(!female.Eligible("uma"));    // unknown: the spouse edge decides
  assert(!female.Eligible("lakshmi"));
}

void TestReligionFilters() {
  kinship::testing::FamilyFixture fixture;
  fixture.AddReligion("rahul", "r-hindu", "c-1", "s-1");
  MemoryRepository repo;
  fixture.SeedInto(repo);
  auto tx = repo.Begin();

  auto include                 = Target(Gender::kMale);
  include.include_religion_ids = {"r-hindu", "r-other"};
  include.include_category_ids = {"c-1"};
  assert(MatchFilter(repo, *tx, include, GenderIds{}).Eligible("rahul"));
  // No religion on record fails an include list.
  assert(!MatchFilter(repo, *tx, include, GenderIds{}).Eligible("hermit"));

  auto wrong_sub                     = Target(Gender::kMale);
  wrong_sub.include_sub_category_ids = {"s-2"};
  assert(!MatchFilter(repo, *tx, wrong_sub, GenderIds{}).Eligible("rahul"));

  auto exclude                     = Target(Gender::kMale);
  exclude.exclude_sub_category_ids = {"s-1"};
  assert(!MatchFilter(repo, *tx, exclude, GenderIds{}).Eligible("rahul"));
  // Exclusion never rejects a person without a sub-category.
  assert(MatchFilter(repo, *tx, exclude, GenderIds{}).Eligible("hermit"));
}

void TestCriteriaValidation() {
  PartnerMatchRequest req;
  req.set_target_gender("f");
  req.set_birth_year_min(1980);
  req.add_exclude_sub_category_ids("s-9");
  auto criteria = MatchCriteriaFromRequest(req);
  assert(criteria.target_gender == Gender::kFemale);
  assert(criteria.birth_year_min == 1980);
  assert(!criteria.birth_year_max);
  assert(criteria.HasReligionFilter());

  bool threw = false;
  req.set_target_gender("other");
  try {
    (void)MatchCriteriaFromRequest(req);
  } catch (const kinship::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  req.set_target_gender("MALE");
  req.set_birth_year_max(1970);
  try {
    (void)MatchCriteriaFromRequest(req);
  } catch (const kinship::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCloseFamilyCoversNeighborsAndSiblings();
  TestEligibilityChecksPersonAttributes();
  TestMaritalStatusOverridesRelationships();
  TestReligionFilters();
  TestCriteriaValidation();

  std::cout << "kinship_unit_match_filter: pass\n";
  return 0;
}
