#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <core/PermutationState.hpp>

// Binary form of a PermutationState:
//
//   "CMPS" | version u8 | traversal u8 | reserved u16
//   N u64 | S u64 | M u64 | cycles u64
//   cursors M * u64 | retired bitmap ceil(M/8) bytes
//   SHA-256 of everything above
//
// Integers are little endian.
class StateCodec {
public:
    static constexpr uint8_t kVersion = 1;
    static constexpr std::size_t kHeaderSize = 40;
    static constexpr std::size_t kDigestSize = 32;

    static std::vector<uint8_t> encode(const PermutationState& state);

    // Throws CorruptStateError for anything that is not a valid encoding.
    static PermutationState decode(const std::vector<uint8_t>& bytes);

    // As above, then throws ConfigurationMismatchError if the stored layout
    // or traversal differ from the expected ones.
    static PermutationState decode(const std::vector<uint8_t>& bytes,
        const DomainLayout& expected,
        TraversalMode expectedMode);

    static std::array<uint8_t, kDigestSize> digest(const uint8_t* data, std::size_t size);
};
