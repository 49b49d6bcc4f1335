#pragma once

#include "kinship/graph/v1.hpp"
#include "service_context.hpp"

namespace kinship::service {

/*
  Partner match: living, unmarried persons of the requested gender within
  a number of hops of the seeker, outside the seeker's close family,
  optionally narrowed by birth year and religion. Returns the matches and
  the breadth-first exploration graph that reached them.
*/
class PartnerMatchService {
public:
  explicit PartnerMatchService(ServiceContext ctx);

  kinship::graph::v1::PartnerMatchResponse
  FindMatches(const kinship::graph::v1::PartnerMatchRequest& req);

private:
  ServiceContext ctx_;
};

}
