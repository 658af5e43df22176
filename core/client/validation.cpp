#include "validation.hpp"

#include <cctype>

namespace hwenergy {
namespace client {

bool is_hex(const std::string &value) {
    for (char c : value) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

errors::Status validate_decryption_key(const std::string &key) {
    if (key.size() != kDecryptionKeyLength) {
        return errors::Error::invalid_argument("key", "Key length should be 32 characters long");
    }
    if (!is_hex(key)) {
        return errors::Error::invalid_argument("key", "Key should only contain hexadecimal characters (0-9/a-f)");
    }
    return errors::Status();
}

errors::Status validate_decryption_aad(const std::string &aad) {
    if (aad.size() != kDecryptionAadLength) {
        std::optional<std::string> hint;
        // Meter labels often print the AAD without its leading "30"
        if (aad.size() == kDecryptionAadLength - 2) {
            hint = "Try prefixing AAD with '30', e.g. '30<AAD>'";
        }
        return errors::Error::invalid_argument("aad", "AAD length should be 34 characters long", hint);
    }
    if (!is_hex(aad)) {
        return errors::Error::invalid_argument("aad", "AAD should only contain hexadecimal characters (0-9/a-f)");
    }
    return errors::Status();
}

}  // namespace client
}  // namespace hwenergy
