#include "Fingerprint.hpp"
#include <openssl/sha.h>
#include <utility>


// Desc: hash data into hex with SHA-256
// In: const std::string& data, std::string& out, size_t hex_chars
// Out: bool (false if OpenSSL failed)
bool sha256_hex(const std::string& data, std::string& out, size_t hex_chars) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    if (!SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest)) {
        return false;
    }
    static const char* hex = "0123456789abcdef";
    std::string h(2 * SHA256_DIGEST_LENGTH, '0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        h[2*i]   = hex[(digest[i]>>4) & 0xF];
        h[2*i+1] = hex[digest[i] & 0xF];
    }
    if (hex_chars < h.size()) h.resize(hex_chars);
    out = std::move(h);
    return true;
}
