#include "digest.hpp"
#include <stdexcept>

namespace
{
const EVP_MD *evp_digest(DigestAlgorithm algorithm)
{
    switch (algorithm)
    {
    case DigestAlgorithm::MD5:
        return EVP_md5();
    case DigestAlgorithm::SHA1:
        return EVP_sha1();
    }
    throw std::invalid_argument("Unknown digest algorithm");
}
} // namespace

Digest::Digest(DigestAlgorithm algorithm) : algorithm(algorithm)
{
    ctx = EVP_MD_CTX_new();
    if (!ctx)
    {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, evp_digest(algorithm), nullptr) != 1)
    {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error(std::string("EVP_DigestInit_ex failed for ") + digest_name(algorithm));
    }
}

Digest::~Digest()
{
    EVP_MD_CTX_free(ctx);
}

void Digest::update(const uint8_t *data, size_t len)
{
    if (finished)
    {
        throw std::logic_error("Digest already finalized");
    }
    if (EVP_DigestUpdate(ctx, data, len) != 1)
    {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Digest::hex_digest()
{
    if (finished)
    {
        throw std::logic_error("Digest already finalized");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx, md, &md_len) != 1)
    {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finished = true;

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i)
    {
        out.push_back(hex[md[i] >> 4]);
        out.push_back(hex[md[i] & 0x0F]);
    }
    return out;
}

DigestAlgorithm Digest::get_algorithm() const
{
    return algorithm;
}

const char *digest_name(DigestAlgorithm algorithm)
{
    switch (algorithm)
    {
    case DigestAlgorithm::MD5:
        return "MD5";
    case DigestAlgorithm::SHA1:
        return "SHA-1";
    }
    return "unknown";
}
