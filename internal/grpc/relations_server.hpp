#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "relations/engine/v1/relations_service.grpc.pb.h"
#include "internal/service/relations_service.hpp"

namespace relations::grpc {

class RelationsServer final : public relations::engine::v1::RelationsService::Service {
public:
  explicit RelationsServer(std::shared_ptr<relations::service::RelationsService> svc);

  ::grpc::Status SendRelation(::grpc::ServerContext*,
                              const relations::engine::v1::SendRelationRequest*,
                              relations::engine::v1::SendRelationResponse*) override;

  ::grpc::Status GetRelations(::grpc::ServerContext*,
                              const relations::engine::v1::GetRelationsRequest*,
                              relations::engine::v1::GetRelationsResponse*) override;

  ::grpc::Status GetAggregations(::grpc::ServerContext*,
                                 const relations::engine::v1::GetAggregationsRequest*,
                                 relations::engine::v1::GetAggregationsResponse*) override;

  ::grpc::Status GetAggregationGroup(::grpc::ServerContext*,
                                     const relations::engine::v1::GetAggregationGroupRequest*,
                                     relations::engine::v1::GetRelationsResponse*) override;

private:
  std::shared_ptr<relations::service::RelationsService> service_;
};

} // namespace relations::grpc
