#pragma once

#include "faucet/v1/faucet.pb.h"

#if FAUCET_WITH_GRPC
#include "faucet/v1/faucet.grpc.pb.h"
#endif
