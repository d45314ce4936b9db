#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "mode/mode.hpp"

// Block modes take block-aligned input only, no padding is applied or removed
class BlockMode : public Mode {
public:
    // Throws std::length_error naming the operation when size is not a multiple of blockSize
    static void requireAligned(size_t size, size_t blockSize, const char* operation);

    // dst[i] ^= src[i] for i < n
    static void xorBlock(uint8_t* dst, const uint8_t* src, size_t n);
};
