#pragma once
#include "cipher/cipher.hpp"
#include <openssl/evp.h>
#include <vector>
#include <string>

// OpenSSL EVP AES-128-ECB used as a bare block cipher under our CBC
class OpenSSL_AES128_Adapter : public Cipher {
public:
    OpenSSL_AES128_Adapter();
    ~OpenSSL_AES128_Adapter() override;

    OpenSSL_AES128_Adapter(const OpenSSL_AES128_Adapter&) = delete;
    OpenSSL_AES128_Adapter& operator=(const OpenSSL_AES128_Adapter&) = delete;

    size_t blockSize() const override { return 16; }

    void setKey(const std::vector<uint8_t>& key) override;

    void encryptBlock(const uint8_t* in, uint8_t* out) const override;
    void decryptBlock(const uint8_t* in, uint8_t* out) const override;

    std::string sourceName() const { return "OpenSSL"; }

private:
    EVP_CIPHER_CTX* enc_;
    EVP_CIPHER_CTX* dec_;
    bool keySet_ = false;
};

// OpenSSL's own EVP_aes_128_cbc, no padding
std::vector<uint8_t> OpenSSL_AES128_CBC_Encrypt(const std::vector<uint8_t>& pt,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv);
