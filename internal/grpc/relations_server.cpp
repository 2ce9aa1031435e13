#include "relations_server.hpp"
#include "grpc_error.hpp"

namespace relations::grpc {

RelationsServer::RelationsServer(std::shared_ptr<relations::service::RelationsService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RelationsServer::SendRelation(::grpc::ServerContext*,
                                             const relations::engine::v1::SendRelationRequest* req,
                                             relations::engine::v1::SendRelationResponse* resp) {
  try {
    *resp = service_->SendRelation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelationsServer::GetRelations(::grpc::ServerContext*,
                                             const relations::engine::v1::GetRelationsRequest* req,
                                             relations::engine::v1::GetRelationsResponse* resp) {
  try {
    *resp = service_->GetRelations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelationsServer::GetAggregations(::grpc::ServerContext*,
                                                const relations::engine::v1::GetAggregationsRequest* req,
                                                relations::engine::v1::GetAggregationsResponse* resp) {
  try {
    *resp = service_->GetAggregations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelationsServer::GetAggregationGroup(::grpc::ServerContext*,
                                                    const relations::engine::v1::GetAggregationGroupRequest* req,
                                                    relations::engine::v1::GetRelationsResponse* resp) {
  try {
    *resp = service_->GetAggregationGroup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relations::grpc
