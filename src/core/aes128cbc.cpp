#include <core/aes128cbc.hpp>
#include <mode/CBC.hpp>

namespace aes128cbc {

	ExpandedKey expandKey(const Key128& key) {
		return AES::expandKey(key);
	}

	Block encryptBlock(const Block& plaintext, const Key128& key) {
		ExpandedKey w = AES::expandKey(key);
		Block state = plaintext;
		AES::encryptState(state, w);
		return state;
	}

	Block decryptBlock(const Block& ciphertext, const Key128& key) {
		ExpandedKey w = AES::expandKey(key);
		Block state = ciphertext;
		AES::decryptState(state, w);
		return state;
	}

	std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext, const Block& iv, const Key128& key) {
		AES aes(key);
		CBC cbc;
		cbc.setIV(iv);
		return cbc.encrypt(plaintext, aes);
	}

	std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext, const Block& iv, const Key128& key) {
		AES aes(key);
		CBC cbc;
		cbc.setIV(iv);
		return cbc.decrypt(ciphertext, aes);
	}

} // namespace aes128cbc
