#include <gtest/gtest.h>
#include "crypto/sha256.hpp"
#include "crypto/random.hpp"
#include <set>

using namespace dcmx::crypto;

TEST(Sha256Test, KnownVectors) {
    EXPECT_EQ(dcmx::hash_to_hex(Sha256::hash(std::string("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(dcmx::hash_to_hex(Sha256::hash(dcmx::bytes{})),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, Deterministic) {
    dcmx::bytes data = {'t', 'r', 'a', 'c', 'k'};
    EXPECT_EQ(Sha256::hash(data), Sha256::hash(data));

    dcmx::bytes other = {'t', 'r', 'a', 'c', 'K'};
    EXPECT_NE(Sha256::hash(data), Sha256::hash(other));
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    dcmx::bytes data(10000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<dcmx::byte>(i % 251);
    }

    Sha256 hasher;
    hasher.update(data.data(), 4096);
    hasher.update(data.data() + 4096, data.size() - 4096);

    EXPECT_EQ(hasher.finalize(), Sha256::hash(data));
}

TEST(RandomTest, GeneratesRequestedSize) {
    auto a = Random::generate(32);
    auto b = Random::generate(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
}

TEST(RandomTest, UniformStaysInRange) {
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(Random::uniform(10), 10u);
    }
}

TEST(RandomTest, UuidV4Format) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = Random::uuid_v4();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[13], '-');
        EXPECT_EQ(id[18], '-');
        EXPECT_EQ(id[23], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
