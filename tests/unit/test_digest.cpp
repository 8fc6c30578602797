#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <unordered_set>
#include "../../src/utils/crypto/digest.hpp"
#include "../../src/utils/text/string_utils.hpp"

using namespace Ferret::Utils;

TEST(DigestTest, KnownVectors) {
    EXPECT_EQ(Crypto::sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Crypto::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, RawAndHexAgree) {
    std::string          input = "https://example.com/";
    std::vector<uint8_t> bytes(input.begin(), input.end());
    auto                 digest = Crypto::sha256(bytes);

    EXPECT_EQ(Text::to_hex(digest.data(), digest.size()), Crypto::sha256_hex(input));
    EXPECT_EQ(Crypto::sha256_hex(input).size(), Crypto::SHA256_SIZE * 2);
}

TEST(DigestTest, DistinctInputsDistinctDigests) {
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(Crypto::sha256_hex("https://example.com/page/" + std::to_string(i)));
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(DigestTest, ConcurrentHashing) {
    const std::string        expected = Crypto::sha256_hex("shared input");
    std::atomic<int>         mismatches{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 200; ++j) {
                if (Crypto::sha256_hex("shared input") != expected)
                    mismatches++;
            }
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(mismatches, 0);
}
