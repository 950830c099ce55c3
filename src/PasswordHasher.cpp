#include "PasswordHasher.hpp"

#include <openssl/rand.h>   // RAND_bytes
#include <argon2.h>         // Argon2id
#include <stdexcept>

namespace {
    constexpr char kHexDigits[] = "0123456789abcdef";

    std::string to_hex(const std::vector<std::uint8_t>& bytes) {
        std::string out;
        out.reserve(bytes.size() * 2);
        for (std::uint8_t b : bytes) {
            out.push_back(kHexDigits[b >> 4]);
            out.push_back(kHexDigits[b & 0x0F]);
        }
        return out;
    }

    int hex_value(char ch) {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        return -1;
    }

    std::vector<std::uint8_t> from_hex(const std::string& hex) {
        if (hex.empty() || hex.size() % 2 != 0) {
            throw std::invalid_argument("from_hex: odd or empty input");
        }
        std::vector<std::uint8_t> out(hex.size() / 2);
        for (std::size_t i = 0; i < out.size(); ++i) {
            int hi = hex_value(hex[2 * i]);
            int lo = hex_value(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                throw std::invalid_argument("from_hex: non-hex character");
            }
            out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
        }
        return out;
    }
}

PasswordHasher::PasswordHasher(KdfParams params)
    : m_params(params)
{
    if (m_params.iterations == 0 || m_params.parallelism == 0) {
        throw std::invalid_argument("PasswordHasher: iterations and parallelism must be > 0");
    }
    if (m_params.memory_kib < 8 * m_params.parallelism) {
        throw std::invalid_argument("PasswordHasher: memory_kib must be >= 8 * parallelism");
    }
}

std::string PasswordHasher::generateSalt() {
    std::vector<std::uint8_t> salt(SALT_LEN);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed for password salt");
    }
    return to_hex(salt);
}

std::vector<std::uint8_t> PasswordHasher::derive(const std::string& plaintext,
                                                 const std::vector<std::uint8_t>& salt) const {
    std::vector<std::uint8_t> hash(HASH_LEN);
    int rc = argon2id_hash_raw(
        m_params.iterations,   // t
        m_params.memory_kib,   // m (KiB)
        m_params.parallelism,  // p
        plaintext.data(),
        plaintext.size(),
        salt.data(),
        salt.size(),
        hash.data(),
        hash.size()
    );
    if (rc != ARGON2_OK) {
        throw std::runtime_error(std::string("argon2id_hash_raw failed: ") + argon2_error_message(rc));
    }
    return hash;
}

std::string PasswordHasher::hashPassword(const std::string& plaintext,
                                         const std::string& saltHex) const {
    return to_hex(derive(plaintext, from_hex(saltHex)));
}

std::string PasswordHasher::createCredential(const std::string& plaintext) const {
    const std::string salt = generateSalt();
    return salt + ":" + hashPassword(plaintext, salt);
}

bool PasswordHasher::verifyPassword(const std::string& plaintext,
                                    const std::string& stored) const {
    const auto sep = stored.find(':');
    if (sep == std::string::npos || stored.find(':', sep + 1) != std::string::npos) {
        return false;
    }

    std::vector<std::uint8_t> salt, expected;
    try {
        salt     = from_hex(stored.substr(0, sep));
        expected = from_hex(stored.substr(sep + 1));
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (salt.size() != SALT_LEN || expected.size() != HASH_LEN) {
        return false;
    }

    std::vector<std::uint8_t> recomputed;
    try {
        recomputed = derive(plaintext, salt);
    } catch (const std::runtime_error&) {
        return false;
    }
    return constTimeEqual(recomputed, expected);
}

void PasswordHasher::burnVerification(const std::string& plaintext) const {
    static const std::vector<std::uint8_t> kDummySalt(SALT_LEN, 0x5A);
    static const std::vector<std::uint8_t> kDummyDigest(HASH_LEN, 0);
    // Result is irrelevant; the derive + compare mirrors verifyPassword's work
    const bool matched = constTimeEqual(derive(plaintext, kDummySalt), kDummyDigest);
    static_cast<void>(matched);
}

bool PasswordHasher::constTimeEqual(const std::vector<std::uint8_t>& a,
                                    const std::vector<std::uint8_t>& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}
