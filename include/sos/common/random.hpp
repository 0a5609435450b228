#pragma once

#include <cstddef>
#include <string>

namespace sos::common {

/// Lowercase hex of `bytes` bytes from the OpenSSL CSPRNG.
[[nodiscard]] std::string random_hex(std::size_t bytes);

/// RFC 4122 version 4 UUID, lowercase with dashes.
[[nodiscard]] std::string uuid_v4();

} // namespace sos::common
