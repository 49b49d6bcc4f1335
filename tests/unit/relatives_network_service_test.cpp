#include "internal/service/relatives_network_service.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/family_fixture.hpp"

namespace {

using kinship::db::memory::MemoryRepository;
using kinship::service::RelativesNetworkService;
using kinship::service::ServiceContext;
using namespace kinship::graph::v1;

ServiceContext BuildServiceContext() {
  auto repository = std::make_shared<MemoryRepository>();
  kinship::testing::FamilyFixture().SeedInto(*repository);

  ServiceContext ctx;
  ctx.repository = repository;
  return ctx;
}

FindRelativesRequest Request(const std::string& person_id, std::uint32_t depth, DepthMode mode = DEPTH_MODE_UP_TO) {
  FindRelativesRequest req;
  req.set_person_id(person_id);
  req.set_depth(depth);
  req.set_depth_mode(mode);
  return req;
}

std::vector<std::string> Ids(const FindRelativesResponse& resp) {
  std::vector<std::string> ids;
  for (const auto& relative : resp.relatives()) ids.push_back(relative.person_id());
  return ids;
}

template <typename Error>
bool Throws(RelativesNetworkService& service, const FindRelativesRequest& req) {
  try {
    (void)service.FindRelatives(req);
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestRelativesByDepthInStableOrder() {
  RelativesNetworkService service(BuildServiceContext());

  auto one = service.FindRelatives(Request("arjun", 1));
  assert(one.person_id() == "arjun");
  assert(one.depth() == 1);
  assert(one.depth_mode() == DEPTH_MODE_UP_TO);
  assert((Ids(one) == std::vector<std::string>{"lakshmi", "vikram"}));

  auto two = service.FindRelatives(Request("arjun", 2));
  assert((Ids(two) == std::vector<std::string>{"lakshmi", "vikram", "kamala", "mohan", "priya"}));
  assert(two.total_count() == 5);
  assert(two.matched_count() == 5);
  assert(!two.truncated());

  auto only_three = service.FindRelatives(Request("arjun", 3, DEPTH_MODE_ONLY_AT));
  assert((Ids(only_three) == std::vector<std::string>{"sunita"}));

  auto all = service.FindRelatives(Request("arjun", 20));
  assert(all.total_count() == 7);
  assert(all.relatives(6).person_id() == "rahul");
  assert(all.relatives(6).depth() == 4);
}

void TestDisplayFieldsAreFilled() {
  RelativesNetworkService service(BuildServiceContext());
  auto                    resp = service.FindRelatives(Request("arjun", 2));

  const auto& lakshmi = resp.relatives(0);
  assert(lakshmi.full_name() == "Lakshmi Rao");
  assert(lakshmi.gender_id() == std::string(kinship::model::kDefaultFemaleGenderId));
  assert(lakshmi.birth_year() == 1963);
  assert(lakshmi.has_age_years());
  assert(!lakshmi.deceased());
  assert(lakshmi.district_name() == "District d1");
  assert(lakshmi.locality_name() == "Locality l2");
  assert(lakshmi.address() == "Locality l2, District d1, Karnataka, India");

  const auto& mohan = resp.relatives(3);
  assert(mohan.person_id() == "mohan");
  assert(mohan.deceased());
  assert(mohan.death_year() == 2015);
  assert(mohan.age_years() == 84);
  assert(mohan.address().empty());
}

void TestFilters() {
  RelativesNetworkService service(BuildServiceContext());

  auto living = Request("arjun", 3);
  living.set_living_only(true);
  assert((Ids(service.FindRelatives(living)) == std::vector<std::string>{"lakshmi", "vikram", "kamala", "priya", "sunita"}));

  auto women = Request("arjun", 3);
  women.set_gender_id(std::string(kinship::model::kDefaultFemaleGenderId));
  assert((Ids(service.FindRelatives(women)) == std::vector<std::string>{"lakshmi", "kamala", "priya", "sunita"}));

  auto district = Request("arjun", 3);
  district.mutable_address()->set_district_id("d1");
  assert((Ids(service.FindRelatives(district)) == std::vector<std::string>{"lakshmi", "vikram", "kamala"}));

  // Filters never cut reachability: rahul is found through unfiltered people.
  auto far_district = Request("arjun", 4, DEPTH_MODE_ONLY_AT);
  far_district.mutable_address()->set_district_id("d2");
  assert((Ids(service.FindRelatives(far_district)) == std::vector<std::string>{"rahul"}));
}

void TestLimitsFromSettings() {
  auto ctx                 = BuildServiceContext();
  ctx.settings.max_depth   = 2;
  ctx.settings.max_results = 2;
  RelativesNetworkService service(ctx);

  auto resp = service.FindRelatives(Request("arjun", 10));
  assert(resp.depth() == 2);
  assert(resp.matched_count() == 5);
  assert(resp.total_count() == 2);
  assert(resp.truncated());
  assert((Ids(resp) == std::vector<std::string>{"lakshmi", "vikram"}));
}

void TestScopedLoadingMatchesFullLoad() {
  auto scoped_ctx = BuildServiceContext();
  auto full_ctx   = BuildServiceContext();
  full_ctx.settings.relatives_scoped_loading = false;

  RelativesNetworkService scoped(scoped_ctx);
  RelativesNetworkService full(full_ctx);

  for (const auto* root : {"arjun", "mohan", "rahul", "dev", "hermit"}) {
    for (std::uint32_t depth = 1; depth <= 5; ++depth) {
      for (auto mode : {DEPTH_MODE_UP_TO, DEPTH_MODE_ONLY_AT}) {
        auto lhs = scoped.FindRelatives(Request(root, depth, mode));
        auto rhs = full.FindRelatives(Request(root, depth, mode));
        assert(google::protobuf::util::MessageDifferencer::Equals(lhs, rhs));
      }
    }
  }
}

void TestIsolatedPersonHasNoRelatives() {
  RelativesNetworkService service(BuildServiceContext());
  auto                    resp = service.FindRelatives(Request("hermit", 3));
  assert(resp.relatives_size() == 0);
  assert(resp.total_count() == 0);
}

void TestInvalidRequests() {
  RelativesNetworkService service(BuildServiceContext());

  assert(Throws<kinship::util::PersonNotFound>(service, Request("nobody", 1)));
  assert(Throws<kinship::util::InvalidArgument>(service, Request("", 1)));
  assert(Throws<kinship::util::InvalidArgument>(service, Request("arjun", 0)));
  assert(Throws<kinship::util::InvalidDepthMode>(service, Request("arjun", 1, static_cast<DepthMode>(9))));

  auto empty_filter = Request("arjun", 1);
  empty_filter.mutable_address()->set_country_id("");
  assert(Throws<kinship::util::InvalidFilter>(service, empty_filter));
}

void TestMalformedEdgeFailsTheQuery() {
  auto repository = std::make_shared<MemoryRepository>();
  kinship::testing::FamilyFixture().SeedInto(*repository);
  {
    auto                                  tx = repository->Begin();
    kinship::db::model::RelationshipRecord bad;
    bad.person_id         = "priya";
    bad.related_person_id = "rahul";
    bad.relationship_type = "cousin";
    assert(repository->InsertRelationship(*tx, bad));
    tx->Commit();
  }

  ServiceContext ctx;
  ctx.repository = repository;
  RelativesNetworkService service(ctx);

  // priya is two hops away, so her edges are loaded from depth 3 on.
  assert(service.FindRelatives(Request("arjun", 2)).total_count() == 5);
  assert(Throws<kinship::util::MalformedEdge>(service, Request("arjun", 3)));
  // Never loaded for an unrelated household.
  assert(service.FindRelatives(Request("dev", 2)).total_count() == 1);
}

void TestSelfLoopIsIgnored() {
  auto repository = std::make_shared<MemoryRepository>();
  kinship::testing::FamilyFixture().SeedInto(*repository);
  {
    auto                                   tx = repository->Begin();
    kinship::db::model::RelationshipRecord loop;
    loop.person_id         = "sunita";
    loop.related_person_id = "sunita";
    loop.relationship_type = "spouse";
    assert(repository->InsertRelationship(*tx, loop));
    tx->Commit();
  }

  ServiceContext ctx;
  ctx.repository = repository;
  RelativesNetworkService service(ctx);

  auto resp = service.FindRelatives(Request("arjun", 4));
  assert(resp.total_count() == 7);
  assert(resp.relatives(6).person_id() == "rahul");

  auto from_sunita = service.FindRelatives(Request("sunita", 1));
  assert((Ids(from_sunita) == std::vector<std::string>{"mohan", "rahul"}));
}

} // namespace

int main() {
  TestRelativesByDepthInStableOrder();
  TestDisplayFieldsAreFilled();
  TestFilters();
  TestLimitsFromSettings();
  TestScopedLoadingMatchesFullLoad();
  TestIsolatedPersonHasNoRelatives();
  TestInvalidRequests();
  TestMalformedEdgeFailsTheQuery();
  TestSelfLoopIsIgnored();

  std::cout << "kinship_unit_relatives_network_service: pass\n";
  return 0;
}
