#pragma once

#include "memorybank/common/result.hpp"

#include <string>

namespace memorybank::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

// RFC 4122 version 4 identifier drawn from the OpenSSL CSPRNG.
[[nodiscard]] Result<std::string> random_uuid_v4();

} // namespace memorybank::common
