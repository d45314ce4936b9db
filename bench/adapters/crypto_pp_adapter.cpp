#include "crypto_pp_adapter.hpp"
#include <stdexcept>

void CryptoPP_AES128_Adapter::setKey(const std::vector<uint8_t>& key) {
    if (key.size() != CryptoPP::AES::DEFAULT_KEYLENGTH) {
        throw std::runtime_error("CryptoPP_AES128_Adapter: key must be 16 bytes");
    }
    enc_.SetKey(key.data(), key.size());
    dec_.SetKey(key.data(), key.size());
    keySet_ = true;
}

void CryptoPP_AES128_Adapter::encryptBlock(const uint8_t* in, uint8_t* out) const {
    if (!keySet_) {
        throw std::runtime_error("Key not set");
    }
    enc_.ProcessBlock(in, out);
}

void CryptoPP_AES128_Adapter::decryptBlock(const uint8_t* in, uint8_t* out) const {
    if (!keySet_) {
        throw std::runtime_error("Key not set");
    }
    dec_.ProcessBlock(in, out);
}
