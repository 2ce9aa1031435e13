#pragma once

#include "relations/engine/v1/relations_service.pb.h"
#include "service_context.hpp"

namespace relations::service {

class RelationsService {
public:
  explicit RelationsService(ServiceContext ctx);

  relations::engine::v1::SendRelationResponse
  SendRelation(const relations::engine::v1::SendRelationRequest& req);

  relations::engine::v1::GetRelationsResponse
  GetRelations(const relations::engine::v1::GetRelationsRequest& req);

  relations::engine::v1::GetAggregationsResponse
  GetAggregations(const relations::engine::v1::GetAggregationsRequest& req);

  relations::engine::v1::GetRelationsResponse
  GetAggregationGroup(const relations::engine::v1::GetAggregationGroupRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace relations::service
