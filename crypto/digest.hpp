#ifndef DIGEST_HPP
#define DIGEST_HPP

#include <cstdint>
#include <string>
#include <openssl/evp.h>

enum class DigestAlgorithm
{
    MD5,
    SHA1
};

// Incremental message digest over an OpenSSL EVP context.
class Digest
{
private:
    EVP_MD_CTX *ctx;
    DigestAlgorithm algorithm;
    bool finished = false;

public:
    explicit Digest(DigestAlgorithm algorithm);
    ~Digest();

    Digest(const Digest &) = delete;
    Digest &operator=(const Digest &) = delete;

    void update(const uint8_t *data, size_t len);
    std::string hex_digest();
    DigestAlgorithm get_algorithm() const;
};

const char *digest_name(DigestAlgorithm algorithm);

#endif
