#pragma once

#include "google/protobuf/struct.pb.h"

#include "fleet/v1/inventory.pb.h"
#include "fleet/v1/module.pb.h"

namespace fleet::v1 {
using Struct = ::google::protobuf::Struct;
using Value  = ::google::protobuf::Value;
}
