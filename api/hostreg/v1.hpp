#pragma once

#include "hostreg/v1/registry_service.pb.h"
#include "hostreg/v1/types.pb.h"
