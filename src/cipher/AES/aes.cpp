#include "cipher/AES/aes.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace {

    inline void secure_memzero(void* p, std::size_t n) noexcept
    {
        volatile uint8_t* v = static_cast<volatile uint8_t*>(p);
        while (n--) *v++ = 0;
    }

} // namespace

AES::AES(const Key128& key)
{
    setKey(key);
}

AES::AES(const std::vector<uint8_t>& key)
{
    setKey(key);
}

AES::~AES()
{
    wipe();
}

void AES::wipe() noexcept
{
    secure_memzero(schedule.data(), schedule.size());
    keyed = false;
}

size_t AES::blockSize() const {
    return BLOCK_SIZE;
}

void AES::setKey(const std::vector<uint8_t>& key)
{
    if (key.size() != KEY_SIZE)
    {
        throw std::invalid_argument("AES-128 key must be 16 bytes, got " + std::to_string(key.size()));
    }

    Key128 key128;
    std::copy(key.begin(), key.end(), key128.begin());
    setKey(key128);
    secure_memzero(key128.data(), key128.size());
}

void AES::setKey(const Key128& key)
{
    wipe();
    schedule = expandKey(key);
    keyed = true;
}

const AES::ExpandedKey& AES::roundKeys() const
{
    if (!keyed)
        throw std::logic_error("AES: key not set");
    return schedule;
}

void AES::encryptBlock(const uint8_t* in, uint8_t* out) const
{
    const ExpandedKey& w = roundKeys();

    State state;
    std::copy(in, in + BLOCK_SIZE, state.begin());
    encryptState(state, w);
    std::copy(state.begin(), state.end(), out);
}

void AES::decryptBlock(const uint8_t* in, uint8_t* out) const
{
    const ExpandedKey& w = roundKeys();

    State state;
    std::copy(in, in + BLOCK_SIZE, state.begin());
    decryptState(state, w);
    std::copy(state.begin(), state.end(), out);
}

void AES::encryptState(State& state, const ExpandedKey& w)
{
    addRoundKey(state, &w[0]);

    for (int round = 1; round < Nr; round++)
    {
        subBytes(state);
        shiftRows(state);
        mixColumns(state);
        addRoundKey(state, &w[round * BLOCK_SIZE]);
    }

    // ostatnia runda bez MixColumns
    subBytes(state);
    shiftRows(state);
    addRoundKey(state, &w[Nr * BLOCK_SIZE]);
}

void AES::decryptState(State& state, const ExpandedKey& w)
{
    addRoundKey(state, &w[Nr * BLOCK_SIZE]);

    for (int round = Nr - 1; round >= 1; round--)
    {
        invShiftRows(state);
        invSubBytes(state);
        addRoundKey(state, &w[round * BLOCK_SIZE]);
        invMixColumns(state);
    }

    invShiftRows(state);
    invSubBytes(state);
    addRoundKey(state, &w[0]);
}

uint8_t AES::xtime(uint8_t x)
{
    return static_cast<uint8_t>((x << 1) ^ ((x & 0x80) ? 0x1b : 0x00));
}

uint8_t AES::gmul(uint8_t a, uint8_t b)
{
    uint8_t result = 0;
    while (b)
    {
        if (b & 1)
            result ^= a;
        a = xtime(a);
        b >>= 1;
    }
    return result;
}

void AES::addRoundKey(State& st, const uint8_t* roundKey)
{
    for (size_t i = 0; i < BLOCK_SIZE; i++)
        st[i] ^= roundKey[i];
}

void AES::rotWord(uint8_t* w)
{
    uint8_t tmp = w[0];
    w[0] = w[1];
    w[1] = w[2];
    w[2] = w[3];
    w[3] = tmp;
}

void AES::subWord(uint8_t* w)
{
    for (int i = 0; i < 4; i++)
        w[i] = sbox[w[i]];
}

// --- Key Expansion (AES-128): 44 words, round key r = words 4r..4r+3 ---
AES::ExpandedKey AES::expandKey(const Key128& key)
{
    const int Nk = 4;
    const int totalWords = 4 * (Nr + 1); // 44

    ExpandedKey w;
    std::copy(key.begin(), key.end(), w.begin());

    for (int i = Nk; i < totalWords; ++i)
    {
        uint8_t temp[4];
        temp[0] = w[4 * (i - 1) + 0];
        temp[1] = w[4 * (i - 1) + 1];
        temp[2] = w[4 * (i - 1) + 2];
        temp[3] = w[4 * (i - 1) + 3];

        if (i % Nk == 0)
        {
            rotWord(temp);
            subWord(temp);
            temp[0] ^= rcon[i / Nk];
        }

        w[4 * i + 0] = w[4 * (i - Nk) + 0] ^ temp[0];
        w[4 * i + 1] = w[4 * (i - Nk) + 1] ^ temp[1];
        w[4 * i + 2] = w[4 * (i - Nk) + 2] ^ temp[2];
        w[4 * i + 3] = w[4 * (i - Nk) + 3] ^ temp[3];
    }

    return w;
}

void AES::subBytes(State& st)
{
    for (auto& b : st)
        b = sbox[b];
}

void AES::invSubBytes(State& st)
{
    for (auto& b : st)
        b = inv_sbox[b];
}

// Row r (bytes r, r+4, r+8, r+12) rotates left by r
void AES::shiftRows(State& st)
{
    State tmp = st;

    tmp[1] = st[5];
    tmp[5] = st[9];
    tmp[9] = st[13];
    tmp[13] = st[1];

    tmp[2] = st[10];
    tmp[6] = st[14];
    tmp[10] = st[2];
    tmp[14] = st[6];

    tmp[3] = st[15];
    tmp[7] = st[3];
    tmp[11] = st[7];
    tmp[15] = st[11];

    st = tmp;
}

void AES::invShiftRows(State& st)
{
    State tmp = st;

    // Row 1 shift right 1
    tmp[1] = st[13];
    tmp[5] = st[1];
    tmp[9] = st[5];
    tmp[13] = st[9];

    // Row 2 shift right 2
    tmp[2] = st[10];
    tmp[6] = st[14];
    tmp[10] = st[2];
    tmp[14] = st[6];

    // Row 3 shift right 3 (inverse of left 3)
    tmp[3] = st[7];
    tmp[7] = st[11];
    tmp[11] = st[15];
    tmp[15] = st[3];

    st = tmp;
}

void AES::mixColumns(State& st)
{
    for (int c = 0; c < 4; c++)
    {
        int i = 4 * c;
        uint8_t a0 = st[i], a1 = st[i + 1], a2 = st[i + 2], a3 = st[i + 3];

        st[i] = gmul(a0, 2) ^ gmul(a1, 3) ^ a2 ^ a3;
        st[i + 1] = a0 ^ gmul(a1, 2) ^ gmul(a2, 3) ^ a3;
        st[i + 2] = a0 ^ a1 ^ gmul(a2, 2) ^ gmul(a3, 3);
        st[i + 3] = gmul(a0, 3) ^ a1 ^ a2 ^ gmul(a3, 2);
    }
}

void AES::invMixColumns(State& st)
{
    for (int c = 0; c < 4; c++)
    {
        int i = 4 * c;
        uint8_t a0 = st[i], a1 = st[i + 1], a2 = st[i + 2], a3 = st[i + 3];

        st[i] = gmul(a0, 14) ^ gmul(a1, 11) ^ gmul(a2, 13) ^ gmul(a3, 9);
        st[i + 1] = gmul(a0, 9) ^ gmul(a1, 14) ^ gmul(a2, 11) ^ gmul(a3, 13);
        st[i + 2] = gmul(a0, 13) ^ gmul(a1, 9) ^ gmul(a2, 14) ^ gmul(a3, 11);
        st[i + 3] = gmul(a0, 11) ^ gmul(a1, 13) ^ gmul(a2, 9) ^ gmul(a3, 14);
    }
}
