#include "lineage_path_service.hpp"

#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/graph/path_finder.hpp"
#include "internal/graph/result_assembler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/graph_loading.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace kinship::service {

using namespace kinship::graph::v1;
using kinship::observability::BoolField;
using kinship::observability::IntField;
using kinship::observability::StringField;

LineagePathService::LineagePathService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

FindPathResponse LineagePathService::FindPath(const FindPathRequest& req) {
  return ObserveQuery("LineagePathService.FindPath", req.person_a_id(), [&] {
    const auto& a = req.person_a_id();
    const auto& b = req.person_b_id();
    if (a.empty() || b.empty()) {
      throw util::InvalidArgument("person_a_id and person_b_id are required");
    }

    auto tx = ctx_.repository->Begin();

    if (!ctx_.repository->LookupPerson(*tx, a)) {
      throw util::PersonNotFound("person A not found: " + a);
    }
    if (!ctx_.repository->LookupPerson(*tx, b)) {
      throw util::PersonNotFound("person B not found: " + b);
    }

    std::vector<db::model::RelationshipRecord> edges;
    if (a != b) {
      const auto max_hops = ctx_.settings.max_hops;
      if (ctx_.settings.path_scoped_loading && max_hops > 0) {
        // Every path of at most max_hops hops has its midpoint within this radius of both ends.
        const auto radius = (max_hops + 1) / 2;
        edges = MergeEdges(ctx_.repository->LoadEdgesNear(*tx, a, radius), ctx_.repository->LoadEdgesNear(*tx, b, radius));
      } else {
        edges = ctx_.repository->LoadAllEdges(*tx);
      }
    }

    const auto view = LoadView(*ctx_.repository, *tx, edges, ctx_.settings.genders, {a, b});
    const auto path = graph::FindPath(view, a, b, ctx_.settings.max_hops);

    auto resp = graph::AssemblePath(*ctx_.repository, *tx, path, ctx_.settings.max_hops, util::Today());
    tx->Commit();

    if (path.connection_found) {
      KINSHIP_LOG_INFO("connection found",
                       {StringField("person_a_id", a),
                        StringField("person_b_id", b),
                        StringField("common_person_id", path.meeting_person_id),
                        IntField("hops", static_cast<std::int64_t>(path.HopCount()))});
    } else {
      KINSHIP_LOG_INFO("no connection",
                       {StringField("person_a_id", a),
                        StringField("person_b_id", b),
                        BoolField("trivial", path.trivial),
                        IntField("max_hops", ctx_.settings.max_hops),
                        IntField("edges", static_cast<std::int64_t>(edges.size()))});
    }

    return resp;
  });
}

} // namespace kinship::service
