#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/relations_service.hpp"
#include "internal/service/room_service.hpp"
#include "internal/service/service_context.hpp"

namespace relations::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext context;

  std::shared_ptr<service::RelationsService> relations_service;
  std::shared_ptr<service::RoomService>      room_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root. The only place that knows concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const relations::runtime::config::RuntimeConfig& config);

// Wires stores, engines and limits over an existing repository.
service::ServiceContext BuildContext(const relations::runtime::config::RuntimeConfig& config,
                                     std::shared_ptr<db::Repository> repository);

Application Build(const relations::runtime::config::RuntimeConfig& config);

} // namespace relations::factory
