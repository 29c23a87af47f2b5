#pragma once

#include "config/config.pb.h"

#include "rfshared/bus/v1/bus.pb.h"
#include "rfshared/bus/v1/bus.grpc.pb.h"
