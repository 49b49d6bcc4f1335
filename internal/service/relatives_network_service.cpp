#include "relatives_network_service.hpp"

#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/graph/discovery.hpp"
#include "internal/graph/relative_filter.hpp"
#include "internal/graph/result_assembler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/graph_loading.hpp"
#include "internal/util/errors.hpp"

namespace kinship::service {

using namespace kinship::graph::v1;
using kinship::observability::BoolField;
using kinship::observability::IntField;
using kinship::observability::StringField;

RelativesNetworkService::RelativesNetworkService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

FindRelativesResponse RelativesNetworkService::FindRelatives(const FindRelativesRequest& req) {
  return ObserveQuery("RelativesNetworkService.FindRelatives", req.person_id(), [&] {
    const auto& root_id = req.person_id();
    if (root_id.empty()) {
      throw util::InvalidArgument("person_id is required");
    }

    // Input errors surface before any data is read.
    const auto mode     = graph::NormalizeDepthMode(req.depth_mode());
    const auto depth    = graph::EffectiveDepth(req.depth(), ctx_.settings.max_depth);
    auto       criteria = graph::CriteriaFromRequest(req);

    auto tx = ctx_.repository->Begin();

    if (!ctx_.repository->LookupPerson(*tx, root_id)) {
      throw util::PersonNotFound("person not found: " + root_id);
    }

    const auto edges = ctx_.settings.relatives_scoped_loading ? ctx_.repository->LoadEdgesNear(*tx, root_id, depth)
                                                              : ctx_.repository->LoadAllEdges(*tx);
    const auto view  = LoadView(*ctx_.repository, *tx, edges, ctx_.settings.genders, {root_id});

    graph::RelativeFilter filter(*ctx_.repository, *tx, std::move(criteria));
    graph::KeepFn         keep;
    if (filter.Active()) {
      keep = [&filter](const std::string& person_id) { return filter.Keep(person_id); };
    }

    const auto discovery = graph::Discover(view, root_id, req.depth(), mode, ctx_.settings.max_depth, keep);

    graph::AssemblyOptions options;
    options.max_results = ctx_.settings.max_results;

    auto resp = graph::AssembleRelatives(*ctx_.repository, *tx, root_id, discovery, options);
    tx->Commit();

    KINSHIP_LOG_INFO("relatives found",
                     {StringField("person_id", root_id),
                      IntField("depth", discovery.effective_depth),
                      StringField("mode", DepthMode_Name(discovery.depth_mode)),
                      IntField("edges", static_cast<std::int64_t>(edges.size())),
                      IntField("visited", static_cast<std::int64_t>(discovery.visited_count)),
                      IntField("matched", resp.matched_count()),
                      IntField("returned", resp.total_count()),
                      BoolField("filtered", filter.Active())});

    if (resp.truncated()) {
      KINSHIP_LOG_INFO("relatives truncated",
                       {StringField("person_id", root_id),
                        IntField("matched", resp.matched_count()),
                        IntField("limit", ctx_.settings.max_results)});
    }

    return resp;
  });
}

} // namespace kinship::service
