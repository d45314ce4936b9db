#pragma once
#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <stdexcept>

class DataConverter {
public:
    // BYTES <-> HEX

    static std::vector<uint8_t> HexToBytes(const std::string& hex) {
        if (hex.size() % 2 != 0)
            throw std::invalid_argument("HexToBytes: hex length must be even");

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);

        for (std::size_t i = 0; i < hex.size(); i += 2) {
            uint8_t high = HexCharToValue(hex[i]);
            uint8_t low = HexCharToValue(hex[i + 1]);
            bytes.push_back(static_cast<uint8_t>((high << 4) | low));
        }
        return bytes;
    }

    static std::string BytesToHex(const std::vector<uint8_t>& bytes) {
        std::string out;
        out.reserve(bytes.size() * 2);

        for (uint8_t b : bytes) {
            out.push_back(ValueToHexChar(b >> 4));
            out.push_back(ValueToHexChar(b & 0x0F));
        }
        return out;
    }

    template<std::size_t N>
    static std::string BytesToHex(const std::array<uint8_t, N>& bytes) {
        return BytesToHex(std::vector<uint8_t>(bytes.begin(), bytes.end()));
    }

	// HexToBytes dla std::array ma sens tylko, jeśli długość jest znana w czasie kompilacji
    template<std::size_t N>
    static std::array<uint8_t, N> HexToBytesFixed(const std::string& hex) {
        if (hex.size() != N * 2)
            throw std::invalid_argument("HexToBytesFixed: expected " + std::to_string(N * 2)
                + " hex characters, got " + std::to_string(hex.size()));

        std::array<uint8_t, N> bytes{};
        for (std::size_t i = 0; i < N; ++i) {
            uint8_t high = HexCharToValue(hex[2 * i]);
            uint8_t low = HexCharToValue(hex[2 * i + 1]);
            bytes[i] = static_cast<uint8_t>((high << 4) | low);
        }
        return bytes;
    }

    template<std::size_t N>
    static std::array<uint8_t, N> BytesToArray(const std::vector<uint8_t>& in) {
        if (in.size() != N)
            throw std::invalid_argument("BytesToArray: expected " + std::to_string(N)
                + " bytes, got " + std::to_string(in.size()));

        std::array<uint8_t, N> arr{};
        for (std::size_t i = 0; i < N; i++) {
            arr[i] = in[i];
        }
        return arr;
    }

private:
    static uint8_t HexCharToValue(char c) {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        throw std::invalid_argument(std::string("Invalid hex character '") + c + "'");
    }

    static char ValueToHexChar(uint8_t v) {
        static const char* hex = "0123456789abcdef";
        return hex[v & 0x0F];
    }
};
