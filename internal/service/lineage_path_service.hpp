#pragma once

#include "kinship/graph/v1.hpp"
#include "service_context.hpp"

namespace kinship::service {

/*
  Lineage path: the shortest labeled chain of relationships between two
  persons.
*/
class LineagePathService {
public:
  explicit LineagePathService(ServiceContext ctx);

  kinship::graph::v1::FindPathResponse
  FindPath(const kinship::graph::v1::FindPathRequest& req);

private:
  ServiceContext ctx_;
};

}
