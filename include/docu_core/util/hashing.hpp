#pragma once

#include <string>
#include <string_view>

namespace docu_core {

// Lowercase hex SHA-256 digest
std::string sha256_hex(std::string_view data);

// Random RFC 4122 version 4 identifier, e.g. "3f2b8c1e-0d4a-4f6b-9c2e-5a7d1e9b0c3f"
std::string generate_uuid4();

}  // namespace docu_core
