#pragma once

#include "registry/v1/registration.pb.h"
#include "registry/v1/registration.grpc.pb.h"
