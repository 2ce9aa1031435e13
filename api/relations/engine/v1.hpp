#pragma once

#include "relations/engine/v1/event.pb.h"
#include "relations/engine/v1/pagination.pb.h"

#include "relations/engine/v1/relations_service.pb.h"
#include "relations/engine/v1/room_service.pb.h"

#include "relations/engine/v1/relations_service.grpc.pb.h"
#include "relations/engine/v1/room_service.grpc.pb.h"
