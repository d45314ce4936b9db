#include "mode/blockMode.hpp"
#include <stdexcept>
#include <string>

void BlockMode::requireAligned(size_t size, size_t blockSize, const char* operation)
{
    if (blockSize == 0 || size % blockSize != 0)
        throw std::length_error(std::string(operation) + ": input length " + std::to_string(size)
            + " is not a multiple of the block size " + std::to_string(blockSize));
}

void BlockMode::xorBlock(uint8_t* dst, const uint8_t* src, size_t n)
{
    for (size_t i = 0; i < n; ++i)
        dst[i] ^= src[i];
}
