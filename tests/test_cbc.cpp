#include <gtest/gtest.h>
#include "cipher/AES/aes.hpp"
#include "core/aes128cbc.hpp"
#include "mode/CBC.hpp"
#include "utils/DataConverter.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    const AES::Key128 kKey = DataConverter::HexToBytesFixed<16>("2b7e151628aed2a6abf7158809cf4f3c");
    const AES::Block kIV = DataConverter::HexToBytesFixed<16>("000102030405060708090a0b0c0d0e0f");

    std::vector<uint8_t> RandomBytes(std::mt19937& gen, size_t n)
    {
        std::uniform_int_distribution<int> byte(0, 255);
        std::vector<uint8_t> out(n);
        for (auto& b : out) b = static_cast<uint8_t>(byte(gen));
        return out;
    }

    int BitDiff(const uint8_t* a, const uint8_t* b, size_t n)
    {
        int bits = 0;
        for (size_t i = 0; i < n; i++) {
            uint8_t x = a[i] ^ b[i];
            while (x) { x &= (x - 1); ++bits; }
        }
        return bits;
    }

    // AES that hands CBC several blocks per decryptBlocks call
    class BatchedAES : public AES {
    public:
        BatchedAES(const Key128& key, size_t batch) : AES(key), batch_(batch) {}
        size_t batchSize() const override { return batch_; }

        void encryptBlock(const uint8_t* in, uint8_t* out) const override {
            ++encryptCalls;
            AES::encryptBlock(in, out);
        }

        void decryptBlocks(const uint8_t* in, uint8_t* out, size_t blocks) const override {
            ++calls;
            maxChunk = std::max(maxChunk, blocks);
            AES::decryptBlocks(in, out, blocks);
        }

        mutable size_t calls = 0;
        mutable size_t encryptCalls = 0;
        mutable size_t maxChunk = 0;

    private:
        size_t batch_;
    };

} // namespace

// ------------------------------------------------------------
// Five copies of one block, first two ciphertext blocks pinned
// ------------------------------------------------------------
TEST(CBC, RepeatedBlockVector)
{
    std::vector<uint8_t> block = DataConverter::HexToBytes("6bc1bee22e409f96e93d7e117393172a");
    std::vector<uint8_t> pt;
    for (int i = 0; i < 5; i++)
        pt.insert(pt.end(), block.begin(), block.end());

    auto ct = aes128cbc::encrypt(pt, kIV, kKey);
    ASSERT_EQ(ct.size(), 80u);

    EXPECT_EQ(DataConverter::BytesToHex(ct),
        "7649abac8119b246cee98e9b12e9197d"
        "4cbbc858756b358125529e9698a38f44"
        "9f6f0796ee3e47b0d87c761b20527f78"
        "070134085f02751755efca3b4cdc7d62"
        "1d9310caac69e1ffeee071202502fa70");

    // identical plaintext blocks must not give identical ciphertext blocks
    for (size_t i = 1; i < 5; i++)
        EXPECT_NE(std::vector<uint8_t>(ct.begin() + (i - 1) * 16, ct.begin() + i * 16),
                  std::vector<uint8_t>(ct.begin() + i * 16, ct.begin() + (i + 1) * 16));

    EXPECT_EQ(aes128cbc::decrypt(ct, kIV, kKey), pt);
}

TEST(CBC, FirstBlockIsBlockCipherOfPlaintextXorIV)
{
    std::mt19937 gen(7);
    auto pt = RandomBytes(gen, 48);
    auto ct = aes128cbc::encrypt(pt, kIV, kKey);

    AES::Block first;
    for (size_t i = 0; i < 16; i++)
        first[i] = pt[i] ^ kIV[i];

    AES::Block expected = aes128cbc::encryptBlock(first, kKey);
    EXPECT_TRUE(std::equal(expected.begin(), expected.end(), ct.begin()));

    // C_1 = E(P_1 ^ C_0)
    AES::Block second;
    for (size_t i = 0; i < 16; i++)
        second[i] = pt[16 + i] ^ ct[i];
    expected = aes128cbc::encryptBlock(second, kKey);
    EXPECT_TRUE(std::equal(expected.begin(), expected.end(), ct.begin() + 16));
}

// ------------------------------------------------------------
// Length validation
// ------------------------------------------------------------
TEST(CBC, RejectsUnalignedLengths)
{
    for (size_t n : { 1u, 15u, 17u, 31u, 33u, 100u }) {
        std::vector<uint8_t> data(n, 0xAB);
        EXPECT_THROW(aes128cbc::encrypt(data, kIV, kKey), std::length_error) << "n=" << n;
        EXPECT_THROW(aes128cbc::decrypt(data, kIV, kKey), std::length_error) << "n=" << n;
    }
}

TEST(CBC, LengthErrorNamesTheSizes)
{
    AES aes(kKey);
    CBC cbc;
    cbc.setIV(kIV);

    try {
        cbc.encrypt(std::vector<uint8_t>(17, 0), aes);
        FAIL() << "expected std::length_error";
    }
    catch (const std::length_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("17"), std::string::npos) << msg;
        EXPECT_NE(msg.find("16"), std::string::npos) << msg;
        EXPECT_NE(msg.find("encrypt"), std::string::npos) << msg;
    }
}

TEST(CBC, EmptyInputGivesEmptyOutput)
{
    EXPECT_TRUE(aes128cbc::encrypt({}, kIV, kKey).empty());
    EXPECT_TRUE(aes128cbc::decrypt({}, kIV, kKey).empty());
}

// ------------------------------------------------------------
// IV handling
// ------------------------------------------------------------
TEST(CBC, RejectsWrongIVSize)
{
    CBC cbc;
    EXPECT_THROW(cbc.setIV(std::vector<uint8_t>(8, 0)), std::invalid_argument);
    EXPECT_THROW(cbc.setIV(std::vector<uint8_t>(17, 0)), std::invalid_argument);
    EXPECT_THROW({ CBC bad(std::vector<uint8_t>{}); }, std::invalid_argument);
    EXPECT_FALSE(cbc.hasIV());
}

TEST(CBC, MissingIVThrows)
{
    AES aes(kKey);
    CBC cbc;
    std::vector<uint8_t> data(32, 0);
    EXPECT_THROW(cbc.encrypt(data, aes), std::logic_error);
    EXPECT_THROW(cbc.decrypt(data, aes), std::logic_error);
}

TEST(CBC, DifferentIVsGiveDifferentCiphertexts)
{
    std::vector<uint8_t> pt(64, 0x00);
    AES::Block iv2 = kIV;
    iv2[15] ^= 0x01;

    auto c1 = aes128cbc::encrypt(pt, kIV, kKey);
    auto c2 = aes128cbc::encrypt(pt, iv2, kKey);

    for (size_t b = 0; b < 4; b++)
        EXPECT_FALSE(std::equal(c1.begin() + b * 16, c1.begin() + (b + 1) * 16, c2.begin() + b * 16))
            << "block " << b;
}

// ------------------------------------------------------------
// Round trip
// ------------------------------------------------------------
TEST(CBC, RoundTripRandom)
{
    std::mt19937 gen(0xC0FFEE);

    for (int t = 0; t < 200; t++) {
        size_t blocks = static_cast<size_t>(t % 12);
        auto pt = RandomBytes(gen, blocks * 16);
        auto keyBytes = RandomBytes(gen, 16);
        auto ivBytes = RandomBytes(gen, 16);

        auto key = DataConverter::BytesToArray<16>(keyBytes);
        auto iv = DataConverter::BytesToArray<16>(ivBytes);

        auto ct = aes128cbc::encrypt(pt, iv, key);
        ASSERT_EQ(ct.size(), pt.size());
        ASSERT_EQ(aes128cbc::decrypt(ct, iv, key), pt) << "iteration " << t;
    }
}

TEST(CBC, ModeObjectIsReusable)
{
    AES aes(kKey);
    CBC cbc(std::vector<uint8_t>(kIV.begin(), kIV.end()));

    std::vector<uint8_t> pt(32, 0x5A);
    auto c1 = cbc.encrypt(pt, aes);
    auto c2 = cbc.encrypt(pt, aes);

    EXPECT_EQ(c1, c2);
    EXPECT_EQ(cbc.decrypt(c1, aes), pt);
    EXPECT_EQ(c1, aes128cbc::encrypt(pt, kIV, kKey));
}

// ------------------------------------------------------------
// Batched decryption
// ------------------------------------------------------------
TEST(CBC, DecryptIndependentOfBatchSize)
{
    std::mt19937 gen(42);
    auto pt = RandomBytes(gen, 16 * 13);
    auto ct = aes128cbc::encrypt(pt, kIV, kKey);

    for (size_t batch : { 1u, 2u, 3u, 4u, 8u, 13u, 64u }) {
        BatchedAES aes(kKey, batch);
        CBC cbc;
        cbc.setIV(kIV);

        EXPECT_EQ(cbc.decrypt(ct, aes), pt) << "batch=" << batch;
        EXPECT_EQ(aes.calls, (13 + batch - 1) / batch) << "batch=" << batch;
        EXPECT_LE(aes.maxChunk, batch);
    }
}

TEST(CBC, EncryptChainsOneBlockAtATime)
{
    std::mt19937 gen(43);
    auto pt = RandomBytes(gen, 16 * 11);
    auto ct = aes128cbc::encrypt(pt, kIV, kKey);

    for (size_t batch : { 1u, 4u, 16u }) {
        BatchedAES aes(kKey, batch);
        CBC cbc(std::vector<uint8_t>(kIV.begin(), kIV.end()));

        EXPECT_EQ(cbc.encrypt(pt, aes), ct) << "batch=" << batch;
        EXPECT_EQ(aes.encryptCalls, 11u) << "batch=" << batch;
        EXPECT_EQ(aes.calls, 0u);
    }
}

// ------------------------------------------------------------
// Error propagation: a flipped bit in C_i garbles P_i and flips
// the same bit of P_{i+1}, nothing else
// ------------------------------------------------------------
TEST(CBC, CiphertextBitFlipPropagation)
{
    std::mt19937 gen(99);
    auto pt = RandomBytes(gen, 16 * 6);
    auto ct = aes128cbc::encrypt(pt, kIV, kKey);

    const size_t blk = 2;
    const size_t byteInBlock = 5;
    const uint8_t mask = 0x10;

    auto bad = ct;
    bad[blk * 16 + byteInBlock] ^= mask;

    auto out = aes128cbc::decrypt(bad, kIV, kKey);
    ASSERT_EQ(out.size(), pt.size());

    for (size_t b = 0; b < 6; b++) {
        const uint8_t* got = &out[b * 16];
        const uint8_t* want = &pt[b * 16];

        if (b == blk) {
            EXPECT_GT(BitDiff(got, want, 16), 20) << "block " << b;
        }
        else if (b == blk + 1) {
            for (size_t i = 0; i < 16; i++)
                EXPECT_EQ(got[i] ^ want[i], i == byteInBlock ? mask : 0) << "byte " << i;
        }
        else {
            EXPECT_TRUE(std::equal(got, got + 16, want)) << "block " << b;
        }
    }
}

TEST(CBC, IVBitFlipOnlyAffectsFirstBlock)
{
    std::mt19937 gen(5);
    auto pt = RandomBytes(gen, 16 * 3);
    auto ct = aes128cbc::encrypt(pt, kIV, kKey);

    AES::Block badIV = kIV;
    badIV[0] ^= 0x80;
    auto out = aes128cbc::decrypt(ct, badIV, kKey);

    EXPECT_EQ(out[0] ^ pt[0], 0x80);
    EXPECT_TRUE(std::equal(out.begin() + 1, out.end(), pt.begin() + 1));
}

// ------------------------------------------------------------
// Avalanche through the chain
// ------------------------------------------------------------
TEST(CBC, PlaintextBitFlipChangesAllFollowingBlocks)
{
    std::mt19937 gen(1234);
    std::uniform_int_distribution<size_t> bitInBlock(0, 127);
    const size_t blocks = 5;

    std::vector<double> sum(blocks, 0.0);
    std::vector<int> samples(blocks, 0);
    const int trials = 100;

    for (int t = 0; t < trials; t++) {
        auto pt = RandomBytes(gen, blocks * 16);
        auto ct = aes128cbc::encrypt(pt, kIV, kKey);

        // flipped block cycles through the whole message
        const size_t flipped = static_cast<size_t>(t) % blocks;
        const size_t bit = flipped * 128 + bitInBlock(gen);
        auto pt2 = pt;
        pt2[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
        auto ct2 = aes128cbc::encrypt(pt2, kIV, kKey);

        for (size_t b = 0; b < blocks; b++) {
            int d = BitDiff(&ct[b * 16], &ct2[b * 16], 16);
            if (b < flipped) {
                EXPECT_EQ(d, 0) << "trial " << t << " block " << b;
                continue;
            }
            EXPECT_GT(d, 0) << "trial " << t << " block " << b;
            sum[b] += d;
            samples[b]++;
        }
    }

    for (size_t b = 0; b < blocks; b++) {
        ASSERT_EQ(samples[b], static_cast<int>((b + 1) * trials / blocks));
        EXPECT_NEAR(sum[b] / samples[b], 64.0, 6.0) << "block " << b;
    }
}

TEST(CBC, LaterPlaintextChangeLeavesEarlierBlocks)
{
    std::mt19937 gen(77);
    auto pt = RandomBytes(gen, 16 * 4);
    auto ct = aes128cbc::encrypt(pt, kIV, kKey);

    auto pt2 = pt;
    pt2[2 * 16] ^= 0x01;
    auto ct2 = aes128cbc::encrypt(pt2, kIV, kKey);

    EXPECT_TRUE(std::equal(ct.begin(), ct.begin() + 32, ct2.begin()));
    EXPECT_FALSE(std::equal(ct.begin() + 32, ct.begin() + 48, ct2.begin() + 32));
    EXPECT_FALSE(std::equal(ct.begin() + 48, ct.end(), ct2.begin() + 48));
}
