#include "openssl_adapter.hpp"
#include <stdexcept>

OpenSSL_AES128_Adapter::OpenSSL_AES128_Adapter()
    : enc_(EVP_CIPHER_CTX_new()), dec_(EVP_CIPHER_CTX_new())
{
    if (!enc_ || !dec_) {
        EVP_CIPHER_CTX_free(enc_);
        EVP_CIPHER_CTX_free(dec_);
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
}

OpenSSL_AES128_Adapter::~OpenSSL_AES128_Adapter() {
    EVP_CIPHER_CTX_free(enc_);
    EVP_CIPHER_CTX_free(dec_);
}

void OpenSSL_AES128_Adapter::setKey(const std::vector<uint8_t>& key) {
    if (key.size() != 16) {
        throw std::runtime_error("OpenSSL_AES128_Adapter: key must be 16 bytes");
    }
    if (EVP_EncryptInit_ex(enc_, EVP_aes_128_ecb(), nullptr, key.data(), nullptr) != 1) {
        throw std::runtime_error("EVP_EncryptInit_ex failed");
    }
    if (EVP_DecryptInit_ex(dec_, EVP_aes_128_ecb(), nullptr, key.data(), nullptr) != 1) {
        throw std::runtime_error("EVP_DecryptInit_ex failed");
    }
    EVP_CIPHER_CTX_set_padding(enc_, 0);
    EVP_CIPHER_CTX_set_padding(dec_, 0);
    keySet_ = true;
}

void OpenSSL_AES128_Adapter::encryptBlock(const uint8_t* in, uint8_t* out) const {
    if (!keySet_) {
        throw std::runtime_error("Key not set");
    }
    int outlen = 0;
    if (EVP_EncryptUpdate(enc_, out, &outlen, in, 16) != 1 || outlen != 16) {
        throw std::runtime_error("EVP_EncryptUpdate failed");
    }
}

void OpenSSL_AES128_Adapter::decryptBlock(const uint8_t* in, uint8_t* out) const {
    if (!keySet_) {
        throw std::runtime_error("Key not set");
    }
    int outlen = 0;
    if (EVP_DecryptUpdate(dec_, out, &outlen, in, 16) != 1 || outlen != 16) {
        throw std::runtime_error("EVP_DecryptUpdate failed");
    }
}

std::vector<uint8_t> OpenSSL_AES128_CBC_Encrypt(const std::vector<uint8_t>& pt,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv)
{
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    std::vector<uint8_t> out(pt.size() + 16);
    int outlen1 = 0, outlen2 = 0;

    bool ok = EVP_EncryptInit_ex(ctx, EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) == 1
        && EVP_CIPHER_CTX_set_padding(ctx, 0) == 1
        && EVP_EncryptUpdate(ctx, out.data(), &outlen1, pt.data(), static_cast<int>(pt.size())) == 1
        && EVP_EncryptFinal_ex(ctx, out.data() + outlen1, &outlen2) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("OpenSSL AES-128-CBC encrypt failed");
    }

    out.resize(static_cast<size_t>(outlen1 + outlen2));
    return out;
}
