#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

class DataConverter {
public:
    // UINT64 -> HEX

    // Fixed width, zero padded. Throws if the value needs more than `width` digits.
    static std::string UintToHex(uint64_t value, std::size_t width, bool uppercase = false) {
        if (width == 0 || width > 16)
            throw std::invalid_argument("UintToHex: width must be between 1 and 16");
        if (width < 16 && (value >> (4 * width)) != 0)
            throw std::invalid_argument("UintToHex: value does not fit in " + std::to_string(width) + " hex digits");

        std::string out(width, '0');
        for (std::size_t i = 0; i < width; ++i) {
            out[width - 1 - i] = ValueToHexChar(static_cast<uint8_t>((value >> (4 * i)) & 0x0F), uppercase);
        }
        return out;
    }

    // UINT64 <-> BYTES (little endian)

    static void AppendUint64LE(std::vector<uint8_t>& out, uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }
    }

    static uint64_t ReadUint64LE(const uint8_t* in) {
        uint64_t value = 0;
        for (int i = 7; i >= 0; --i) {
            value = (value << 8) | in[i];
        }
        return value;
    }

private:
    static char ValueToHexChar(uint8_t v, bool uppercase) {
        static const char* upper = "0123456789ABCDEF";
        static const char* lower = "0123456789abcdef";
        return (uppercase ? upper : lower)[v & 0x0F];
    }
};
