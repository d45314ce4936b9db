#pragma once
#include <cstdint>
#include <vector>
#include <cipher/AES/aes.hpp>

// One-shot AES-128 / CBC entry points on fixed-size key, IV and block types.
// Buffer lengths that are not a multiple of 16 raise std::length_error.
namespace aes128cbc {

	using Block = AES::Block;
	using Key128 = AES::Key128;
	using ExpandedKey = AES::ExpandedKey;

	ExpandedKey expandKey(const Key128& key);

	Block encryptBlock(const Block& plaintext, const Key128& key);
	Block decryptBlock(const Block& ciphertext, const Key128& key);

	std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext, const Block& iv, const Key128& key);
	std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext, const Block& iv, const Key128& key);

} // namespace aes128cbc
