#pragma once

#include "camsync/v1/types.pb.h"
#include "camsync/v1/discovery.pb.h"

#include "camsync/v1/registry_service.pb.h"
#include "camsync/v1/node_service.pb.h"
#include "camsync/v1/operator_service.pb.h"

#include "camsync/v1/registry_service.grpc.pb.h"
#include "camsync/v1/node_service.grpc.pb.h"
#include "camsync/v1/operator_service.grpc.pb.h"
