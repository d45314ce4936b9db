#pragma once
#include "cipher/cipher.hpp"
#include <aes.h>
#include <vector>
#include <string>

// Crypto++ AES block transform used under our CBC
class CryptoPP_AES128_Adapter : public Cipher {
public:
    CryptoPP_AES128_Adapter() = default;
    ~CryptoPP_AES128_Adapter() override = default;

    size_t blockSize() const override { return CryptoPP::AES::BLOCKSIZE; }

    void setKey(const std::vector<uint8_t>& key) override;

    void encryptBlock(const uint8_t* in, uint8_t* out) const override;
    void decryptBlock(const uint8_t* in, uint8_t* out) const override;

    std::string sourceName() const { return "Crypto++"; }

private:
    CryptoPP::AES::Encryption enc_;
    CryptoPP::AES::Decryption dec_;
    bool keySet_ = false;
};
