#pragma once

#include "cirrus/gateway/v1/access_control.pb.h"
#include "cirrus/gateway/v1/gateway.pb.h"
