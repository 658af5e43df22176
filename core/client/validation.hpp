#pragma once

#include <string>

#include "errors/errors.hpp"

namespace hwenergy {
namespace client {

constexpr size_t kDecryptionKeyLength = 32;
constexpr size_t kDecryptionAadLength = 34;

// True if every character is 0-9, a-f or A-F (empty string is hex)
bool is_hex(const std::string &value);

// 32 hexadecimal characters
errors::Status validate_decryption_key(const std::string &key);

// 34 hexadecimal characters. A 32-character value gets a hint about the "30" prefix.
errors::Status validate_decryption_aad(const std::string &aad);

}  // namespace client
}  // namespace hwenergy
