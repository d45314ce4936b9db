#include "mode/CBC.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

CBC::CBC(const std::vector<uint8_t>& initVector)
{
    setIV(initVector);
}

void CBC::setIV(const std::vector<uint8_t>& initVector)
{
    if (initVector.size() != IV_SIZE)
        throw std::invalid_argument("IV must be 16 bytes, got " + std::to_string(initVector.size()));
    std::copy(initVector.begin(), initVector.end(), iv.begin());
    ivSet = true;
}

void CBC::setIV(const std::array<uint8_t, IV_SIZE>& initVector)
{
    iv = initVector;
    ivSet = true;
}

void CBC::checkReady(const Cipher& cipher) const
{
    if (!ivSet)
        throw std::logic_error("CBC: IV not set");
    if (cipher.blockSize() != IV_SIZE)
        throw std::invalid_argument("CBC: cipher block size " + std::to_string(cipher.blockSize())
            + " does not match IV size");
}

std::vector<uint8_t> CBC::encrypt(const std::vector<uint8_t>& data, Cipher& cipher)
{
    checkReady(cipher);
    const size_t B = cipher.blockSize();
    requireAligned(data.size(), B, "CBC encrypt");

    std::vector<uint8_t> out = data;
    const uint8_t* prev = iv.data();

    // C_i = E(P_i ^ C_{i-1}), each block waits on the previous one
    for (size_t off = 0; off < out.size(); off += B) {
        uint8_t* blk = &out[off];
        xorBlock(blk, prev, B);
        cipher.encryptBlock(blk, blk);
        prev = blk;
    }

    return out;
}

std::vector<uint8_t> CBC::decrypt(const std::vector<uint8_t>& data, Cipher& cipher)
{
    checkReady(cipher);
    const size_t B = cipher.blockSize();
    const size_t N = std::max<size_t>(1, cipher.batchSize());
    requireAligned(data.size(), B, "CBC decrypt");

    std::vector<uint8_t> out(data.size());

    size_t blocks = data.size() / B;
    size_t i = 0;

    while (i < blocks) {
        size_t chunk = std::min(N, blocks - i);

        // blocks in a chunk are independent, chaining input is the raw ciphertext
        cipher.decryptBlocks(&data[i * B], &out[i * B], chunk);

        for (size_t j = 0; j < chunk; j++) {
            size_t k = i + j;
            const uint8_t* prevBlk = (k == 0 ? iv.data() : &data[(k - 1) * B]);
            xorBlock(&out[k * B], prevBlk, B);
        }

        i += chunk;
    }

    return out;
}
