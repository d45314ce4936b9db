#include <CLI/CLI.hpp>
#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>

#include <cipher/AES/aes.hpp>
#include <mode/CBC.hpp>
#include <utils/DataConverter.hpp>

std::vector<uint8_t> decode(const std::string& input, const std::string& encoding) {
    if (encoding == "utf8") {
        return std::vector<uint8_t>(input.begin(), input.end());
    }
    if (encoding == "hex") {
        return DataConverter::HexToBytes(input);
    }
    throw std::runtime_error("Unknown encoding: " + encoding);
}

void validateKey(const std::vector<uint8_t>& key) {
    if (key.size() != AES::KEY_SIZE) {
        throw std::runtime_error("AES-128 key must be 16 bytes (128 bits). Got: " + std::to_string(key.size()) + " bytes");
    }
}

void validateIV(const std::vector<uint8_t>& iv) {
    if (iv.size() != CBC::IV_SIZE) {
        throw std::runtime_error("IV must be 16 bytes for CBC. Got: " + std::to_string(iv.size()) + " bytes");
    }
}

int main(int argc, char** argv) {
    CLI::App app{"aes128cbc - AES-128 CBC Encryption/Decryption Tool"};

    std::string text;
    std::string text_encoding = "hex";

    std::string key;
    std::string key_encoding = "hex";

    std::string iv;

    std::string operation = "encrypt";
    std::string output_encoding = "hex";
    bool verbose = false;

    // Text options
    app.add_option("--text,-t", text, "Data to encrypt/decrypt, length must be a multiple of 16 bytes")->required();
    app.add_option("--text-encoding", text_encoding, "Text encoding (hex, utf8)")
        ->check(CLI::IsMember({"hex", "utf8"}));

    // Key options
    app.add_option("--key,-k", key, "128-bit key")->required();
    app.add_option("--key-encoding", key_encoding, "Key encoding (hex, utf8)")
        ->check(CLI::IsMember({"hex", "utf8"}));

    app.add_option("--iv", iv, "Initialization vector (hex, 16 bytes)")->required();

    // Operation options
    app.add_option("--operation,-o", operation, "Operation (encrypt, decrypt)")
        ->check(CLI::IsMember({"encrypt", "decrypt"}));
    app.add_option("--output-encoding", output_encoding, "Output encoding (hex, utf8)")
        ->check(CLI::IsMember({"hex", "utf8"}));
    app.add_flag("--verbose,-v", verbose, "Print diagnostics to stderr");

    CLI11_PARSE(app, argc, argv);

    try {
        // Normalize input
        auto data_bytes = decode(text, text_encoding);
        auto key_bytes = decode(key, key_encoding);
        auto iv_bytes = decode(iv, "hex");

        validateKey(key_bytes);
        validateIV(iv_bytes);

        if (verbose) {
            std::cerr << "[*] " << operation << " " << data_bytes.size() << " bytes ("
                      << data_bytes.size() / AES::BLOCK_SIZE << " blocks)\n";
            std::cerr << "[*] IV " << DataConverter::BytesToHex(iv_bytes) << "\n";
        }

        AES aes(key_bytes);
        CBC cbc(iv_bytes);

        std::vector<uint8_t> result;
        if (operation == "encrypt") {
            result = cbc.encrypt(data_bytes, aes);
        } else {
            result = cbc.decrypt(data_bytes, aes);
        }

        // Output result
        if (output_encoding == "hex") {
            std::cout << DataConverter::BytesToHex(result) << std::endl;
        } else {
            std::cout << std::string(result.begin(), result.end()) << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
