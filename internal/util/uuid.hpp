#pragma once

#include <string>

namespace graphvc::util {

/*
  Object, version and branch ids are RFC4122 v4 UUIDs in their
  canonical 36 character text form.
*/
std::string NewId();

} // namespace graphvc::util
