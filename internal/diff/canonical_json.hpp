#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

namespace graphvc::diff {

/*
  Deterministic JSON rendering used for content hashing and size
  accounting.

  - object keys sorted bytewise
  - no insignificant whitespace
  - integral numbers below 2^53 printed without a fraction
  - other numbers in shortest round-trip form
  - NaN / Inf and unset values print as null
*/

std::string CanonicalJson(const google::protobuf::Value& value);
std::string CanonicalJson(const google::protobuf::Struct& value);

// sha256 over the canonical JSON of `properties`. An empty tree hashes like {}.
std::string ContentHash(const google::protobuf::Struct& properties);

} // namespace graphvc::diff
