#pragma once

#include "reel/orchestrator/v1/types.pb.h"
#include "reel/orchestrator/v1/generation_service.pb.h"

#include "reel/provider/v1/provider_service.pb.h"

namespace reel::orchestrator::v1 {
using namespace ::reel::provider::v1;
}
