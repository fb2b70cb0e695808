/**
 * @file test_sha256.cpp
 * @brief SHA-256 digests used for input and stable finding ids
 */

#include "stylint/common.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace stylint::common;

TEST(SHA256, KnownVectors)
{
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256, MultiBlockInput)
{
    // 56 bytes forces the length into a second block.
    EXPECT_EQ(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256, ContractSourceDigestIsStable)
{
    const std::string source = "sol_storage! { #[entrypoint] pub struct Counter { uint256 count; } }";
    EXPECT_EQ(sha256(source), sha256(source));
    EXPECT_NE(sha256(source), sha256(source + "\n"));
}

TEST(SHA256, Prefixed)
{
    const std::string digest = sha256_prefixed("counter");
    EXPECT_TRUE(digest.starts_with("sha256:"));
    EXPECT_EQ(digest.size(), 7U + 64U);
    EXPECT_EQ(digest.substr(7), sha256("counter"));
}

TEST(SHA256, BinaryInputWithNulBytes)
{
    const std::string wasm("\0asm\x01\0\0\0", 8);
    EXPECT_NE(sha256(wasm), sha256("\0asm"));
    EXPECT_EQ(sha256(wasm).size(), 64U);
}
