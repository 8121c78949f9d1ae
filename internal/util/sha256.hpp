#pragma once

#include <string>
#include <string_view>

namespace graphvc::util {

// Lowercase hex SHA-256 digest of the input bytes (OpenSSL EVP).
std::string Sha256Hex(std::string_view data);

} // namespace graphvc::util
