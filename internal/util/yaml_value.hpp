#pragma once

#include <google/protobuf/struct.pb.h>
#include <yaml-cpp/yaml.h>

namespace fleet::util {

/*
  Converts a YAML document into the JSON value model.

  Plain scalars "true"/"false" become booleans and numeric plain scalars
  become numbers; quoted scalars always stay strings.
*/
void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

} // namespace fleet::util
