#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include <mode/mode.hpp>
#include <mode/blockMode.hpp>

// Cipher Block Chaining over any 16-byte block cipher.
//
// A corrupted ciphertext block C_i garbles all of P_i and flips exactly the
// corresponding bits of P_{i+1}; later blocks decrypt correctly.
class CBC : public BlockMode {
public:
    static constexpr size_t IV_SIZE = 16;

    CBC() = default;
    explicit CBC(const std::vector<uint8_t>& iv);

    std::vector<uint8_t> encrypt(const std::vector<uint8_t>& data, Cipher& cipher) override;
    std::vector<uint8_t> decrypt(const std::vector<uint8_t>& data, Cipher& cipher) override;

    void setIV(const std::vector<uint8_t>& iv);
    void setIV(const std::array<uint8_t, IV_SIZE>& iv);
    bool hasIV() const { return ivSet; }

private:
    void checkReady(const Cipher& cipher) const;

    std::array<uint8_t, IV_SIZE> iv = {};
    bool ivSet = false;
};
