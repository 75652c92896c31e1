#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include "crypto/digest.hpp"
#include "dump/sink.hpp"
#include "test_support.hpp"

namespace
{
std::string hash_of(DigestAlgorithm algorithm, const std::string &text)
{
    Digest digest(algorithm);
    digest.update(reinterpret_cast<const uint8_t *>(text.data()), text.size());
    return digest.hex_digest();
}
} // namespace

TEST(DigestTest, KnownVectors)
{
    EXPECT_EQ(hash_of(DigestAlgorithm::MD5, ""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(hash_of(DigestAlgorithm::MD5, "abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(hash_of(DigestAlgorithm::SHA1, ""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EXPECT_EQ(hash_of(DigestAlgorithm::SHA1, "abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(DigestTest, IncrementalUpdatesMatchOneShot)
{
    Digest digest(DigestAlgorithm::SHA1);
    const std::string text = "abc";
    for (char c : text)
    {
        uint8_t byte = static_cast<uint8_t>(c);
        digest.update(&byte, 1);
    }
    EXPECT_EQ(digest.hex_digest(), hash_of(DigestAlgorithm::SHA1, text));
}

TEST(DigestTest, FinalizedDigestRejectsReuse)
{
    Digest digest(DigestAlgorithm::MD5);
    digest.hex_digest();
    uint8_t byte = 0;
    EXPECT_THROW(digest.update(&byte, 1), std::logic_error);
    EXPECT_THROW(digest.hex_digest(), std::logic_error);
}

TEST(DigestTest, DigestSinkForwardsAndHashes)
{
    std::vector<uint8_t> written;
    VectorSink inner(written);
    DigestSink sink(inner, {DigestAlgorithm::MD5, DigestAlgorithm::SHA1});

    const uint8_t first[] = {'a', 'b'};
    const uint8_t second[] = {'c'};
    sink.write(first, sizeof(first));
    sink.write(second, sizeof(second));
    sink.flush();

    EXPECT_EQ(written, (std::vector<uint8_t>{'a', 'b', 'c'}));
    EXPECT_EQ(inner.flushes, 1u);

    auto digests = sink.finish();
    ASSERT_EQ(digests.size(), 2u);
    EXPECT_EQ(digests[0].first, "MD5");
    EXPECT_EQ(digests[0].second, "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(digests[1].first, "SHA-1");
    EXPECT_EQ(digests[1].second, "a9993e364706816aba3e25717850c26c9cd0d89d");
}
