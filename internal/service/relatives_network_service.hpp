#pragma once

#include "kinship/graph/v1.hpp"
#include "service_context.hpp"

namespace kinship::service {

/*
  Relatives network: every person reachable from a root within a number of
  relationship hops, optionally filtered by living status, gender and
  current address.
*/
class RelativesNetworkService {
public:
  explicit RelativesNetworkService(ServiceContext ctx);

  kinship::graph::v1::FindRelativesResponse
  FindRelatives(const kinship::graph::v1::FindRelativesRequest& req);

private:
  ServiceContext ctx_;
};

}
