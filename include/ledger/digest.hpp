#pragma once

#include <string>
#include <string_view>

namespace neuro_guard::ledger {

// Lower-case hex SHA-256 of the input bytes. Throws std::runtime_error if libcrypto fails.
std::string sha256_hex(std::string_view input);

}  // namespace neuro_guard::ledger
