#include "partner_match_service.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/discovery.hpp"
#include "internal/graph/match_filter.hpp"
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

PartnerMatchService::PartnerMatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PartnerMatchResponse PartnerMatchService::FindMatches(const PartnerMatchRequest& req) {
  return ObserveQuery("PartnerMatchService.FindMatches", req.seeker_person_id(), [&] {
    const auto& seeker_id = req.seeker_person_id();
    if (seeker_id.empty()) {
      throw util::InvalidArgument("seeker_person_id is required");
    }

    auto       criteria  = graph::MatchCriteriaFromRequest(req);
    const auto requested = req.max_depth() > 0 ? req.max_depth() : ctx_.settings.match_default_depth;
    const auto depth     = graph::EffectiveDepth(requested, ctx_.settings.match_max_depth);
    const bool prune     = !req.has_prune_graph() || req.prune_graph();

    auto tx = ctx_.repository->Begin();

    if (!ctx_.repository->LookupPerson(*tx, seeker_id)) {
      throw util::PersonNotFound("seeker not found: " + seeker_id);
    }

    // Sibling detection reads the parents' edges, two hops out.
    const auto edges = ctx_.settings.match_scoped_loading
                           ? ctx_.repository->LoadEdgesNear(*tx, seeker_id, std::max<std::uint32_t>(depth, 2))
                           : ctx_.repository->LoadAllEdges(*tx);
    const auto view  = LoadView(*ctx_.repository, *tx, edges, ctx_.settings.genders, {seeker_id});

    const auto discovery =
        graph::Discover(view, seeker_id, requested, DEPTH_MODE_UP_TO, ctx_.settings.match_max_depth);
    const auto close = graph::CloseFamily(view, seeker_id);

    graph::MatchFilter       filter(*ctx_.repository, *tx, std::move(criteria), ctx_.settings.genders);
    std::vector<std::string> matches;
    for (const auto& discovered : discovery.relatives) {
      if (close.contains(discovered.person_id)) {
        continue;
      }
      if (filter.Eligible(discovered.person_id)) {
        matches.push_back(discovered.person_id);
      }
    }

    auto resp = graph::AssembleMatchGraph(*ctx_.repository, *tx, seeker_id, discovery, matches, prune, util::Today());
    tx->Commit();

    KINSHIP_LOG_INFO("partner matches found",
                     {StringField("seeker_id", seeker_id),
                      StringField("target_gender", req.target_gender()),
                      IntField("depth", discovery.effective_depth),
                      IntField("visited", static_cast<std::int64_t>(discovery.visited_count)),
                      IntField("close_family", static_cast<std::int64_t>(close.size())),
                      IntField("matches", static_cast<std::int64_t>(matches.size())),
                      IntField("graph_nodes", resp.exploration_graph_size()),
                      BoolField("pruned", prune)});

    return resp;
  });
}

} // namespace kinship::service
