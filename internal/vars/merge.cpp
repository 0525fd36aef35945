#include "merge.hpp"

namespace fleet::vars {

void MergeInto(google::protobuf::Struct* base, const google::protobuf::Struct& overlay) {
  auto& fields = *base->mutable_fields();

  for (const auto& [key, value] : overlay.fields()) {
    auto it = fields.find(key);
    if (it != fields.end() && it->second.has_struct_value() && value.has_struct_value()) {
      MergeInto(it->second.mutable_struct_value(), value.struct_value());
      continue;
    }
    fields[key] = value;
  }
}

google::protobuf::Struct Merge(const google::protobuf::Struct& base, const google::protobuf::Struct& overlay) {
  google::protobuf::Struct merged = base;
  MergeInto(&merged, overlay);
  return merged;
}

} // namespace fleet::vars
