#pragma once

#include <google/protobuf/struct.pb.h>

namespace fleet::vars {

/*
  Variable precedence merge.

  Scalars and lists in overlay replace the key in base. Mappings present on
  both sides are merged key by key, so an overlay that sets one nested key
  keeps the sibling keys of base. Callers apply mappings in ascending
  precedence order: Merge(Merge(a, b), c).
*/
google::protobuf::Struct Merge(const google::protobuf::Struct& base, const google::protobuf::Struct& overlay);

void MergeInto(google::protobuf::Struct* base, const google::protobuf::Struct& overlay);

} // namespace fleet::vars
