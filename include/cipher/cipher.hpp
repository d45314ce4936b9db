#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

class Cipher {
public:
	virtual ~Cipher() = default;

	virtual size_t blockSize() const = 0;

	// Number of blocks a mode may hand over in one decryptBlocks call.
	// Encryption in a chaining mode always goes through encryptBlock.
	virtual size_t batchSize() const { return 1; }

	virtual void setKey(const std::vector<uint8_t>& key) = 0;

	// Encrypt one block, in and out may alias
	virtual void encryptBlock(const uint8_t* in, uint8_t* out) const = 0;

	// Decrypt one block, in and out may alias
	virtual void decryptBlock(const uint8_t* in, uint8_t* out) const = 0;

	virtual void decryptBlocks(const uint8_t* in, uint8_t* out, size_t blocks) const
	{
		const size_t B = blockSize();
		for (size_t i = 0; i < blocks; i++)
			decryptBlock(in + i * B, out + i * B);
	}
};
