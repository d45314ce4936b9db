#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <cipher/cipher.hpp>


class AES : public Cipher
{
public:
    static constexpr size_t BLOCK_SIZE = 16;
    static constexpr size_t KEY_SIZE = 16;
    static constexpr int Nr = 10;                                   // rounds for AES-128
    static constexpr size_t EXPANDED_KEY_SIZE = BLOCK_SIZE * (Nr + 1); // 176

    using State = std::array<uint8_t, BLOCK_SIZE>;
    using Block = State;
    using Key128 = std::array<uint8_t, KEY_SIZE>;
    using ExpandedKey = std::array<uint8_t, EXPANDED_KEY_SIZE>;

    // --- S-box ---
    static const std::array<uint8_t, 256> sbox;
    // --- Inverse S-box ---
    static const std::array<uint8_t, 256> inv_sbox;
    // --- Round constants, index 0 unused ---
    static const std::array<uint8_t, Nr + 1> rcon;

    AES() = default;
    explicit AES(const Key128& key);
    explicit AES(const std::vector<uint8_t>& key);
    ~AES() override;


    size_t blockSize() const override;

    void setKey(const std::vector<uint8_t>& key) override;
    void setKey(const Key128& key);

    bool hasKey() const { return keyed; }

    // Cached schedule, throws std::logic_error when no key was set
    const ExpandedKey& roundKeys() const;

    void encryptBlock(const uint8_t* in, uint8_t* out) const override;
    void decryptBlock(const uint8_t* in, uint8_t* out) const override;

    // --- GF(2^8) arithmetic, reduction polynomial x^8 + x^4 + x^3 + x + 1 ---
    static uint8_t xtime(uint8_t x);
    static uint8_t gmul(uint8_t a, uint8_t b);

    // --- Table lookups ---
    static uint8_t subByte(uint8_t b) { return sbox[b]; }
    static uint8_t invSubByte(uint8_t b) { return inv_sbox[b]; }

    // --- Key expansion (AES-128) ---
    static void rotWord(uint8_t* w);
    static void subWord(uint8_t* w);
    static ExpandedKey expandKey(const Key128& key);

    // XOR one 16-byte window of the schedule into the state
    static void addRoundKey(State& st, const uint8_t* roundKey);

    // --- AES forward operations ---
    static void subBytes(State& st);
    static void shiftRows(State& st);
    static void mixColumns(State& st);

    // --- AES inverse operations (for decryption) ---
    static void invSubBytes(State& st);
    static void invShiftRows(State& st);
    static void invMixColumns(State& st);

    // Full 10-round transforms of one state under an expanded key
    static void encryptState(State& st, const ExpandedKey& w);
    static void decryptState(State& st, const ExpandedKey& w);

private:
    void wipe() noexcept;

    ExpandedKey schedule{};
    bool keyed = false;
};
