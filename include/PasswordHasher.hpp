#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Argon2id work factor. Changing it invalidates previously stored credentials.
struct KdfParams {
    std::uint32_t iterations  = 3;         // t
    std::uint32_t memory_kib  = 64 * 1024; // m (~64 MiB)
    std::uint32_t parallelism = 1;         // p
};

// Stored credential format is "<salt-hex>:<digest-hex>"
class PasswordHasher {
public:
    explicit PasswordHasher(KdfParams params = KdfParams{});

    // 16 random bytes from RAND_bytes, hex-encoded (32 chars)
    static std::string generateSalt();

    // Argon2id(plaintext, salt) -> 32-byte digest, hex-encoded.
    // Throws std::invalid_argument if saltHex is not valid hex.
    std::string hashPassword(const std::string& plaintext, const std::string& saltHex) const;

    // Fresh salt + digest joined as "salt:digest"
    std::string createCredential(const std::string& plaintext) const;

    // Constant-time comparison; false (never throws) on malformed stored strings
    bool verifyPassword(const std::string& plaintext, const std::string& stored) const;

    // Spends the same KDF time as a real verification. Used when no account matched.
    void burnVerification(const std::string& plaintext) const;

    const KdfParams& params() const { return m_params; }

private:
    static bool constTimeEqual(const std::vector<std::uint8_t>& a,
                               const std::vector<std::uint8_t>& b);

    std::vector<std::uint8_t> derive(const std::string& plaintext,
                                     const std::vector<std::uint8_t>& salt) const;

    static constexpr std::size_t SALT_LEN = 16;
    static constexpr std::size_t HASH_LEN = 32;

    KdfParams m_params;
};
