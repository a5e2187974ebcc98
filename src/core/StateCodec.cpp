#include "core/StateCodec.hpp"
#include "core/Errors.hpp"
#include "utils/DataConverter.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

const uint8_t kMagic[4] = { 'C', 'M', 'P', 'S' };

std::size_t bitmapSize(uint64_t sections) {
    return static_cast<std::size_t>((sections + 7) / 8);
}

} // namespace

std::array<uint8_t, StateCodec::kDigestSize> StateCodec::digest(const uint8_t* data, std::size_t size) {
    std::array<uint8_t, kDigestSize> md{};
    unsigned int mdLen = 0;
    if (EVP_Digest(data, size, md.data(), &mdLen, EVP_sha256(), nullptr) != 1 || mdLen != kDigestSize) {
        throw std::runtime_error("EVP_Digest(SHA-256) failed");
    }
    return md;
}

std::vector<uint8_t> StateCodec::encode(const PermutationState& state) {
    const DomainLayout& layout = state.layout();
    const uint64_t M = layout.sectionCount;

    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + 8 * M + bitmapSize(M) + kDigestSize);

    out.insert(out.end(), std::begin(kMagic), std::end(kMagic));
    out.push_back(kVersion);
    out.push_back(static_cast<uint8_t>(state.traversal()));
    out.push_back(0);
    out.push_back(0);
    DataConverter::AppendUint64LE(out, layout.domainSize);
    DataConverter::AppendUint64LE(out, layout.sectionSize);
    DataConverter::AppendUint64LE(out, M);
    DataConverter::AppendUint64LE(out, state.completedCycles());

    for (uint64_t c : state.cursors()) {
        DataConverter::AppendUint64LE(out, c);
    }

    std::vector<uint8_t> bitmap(bitmapSize(M), 0);
    const auto& retired = state.retired();
    for (uint64_t i = 0; i < M; ++i) {
        if (retired[i]) bitmap[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
    }
    out.insert(out.end(), bitmap.begin(), bitmap.end());

    auto md = digest(out.data(), out.size());
    out.insert(out.end(), md.begin(), md.end());
    return out;
}

PermutationState StateCodec::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kHeaderSize + kDigestSize) {
        throw CorruptStateError("State blob is too short: " + std::to_string(bytes.size()) + " bytes");
    }
    if (std::memcmp(bytes.data(), kMagic, sizeof(kMagic)) != 0) {
        throw CorruptStateError("State blob has no CMPS magic");
    }
    if (bytes[4] != kVersion) {
        throw CorruptStateError("Unsupported state version " + std::to_string(bytes[4]));
    }

    const std::size_t bodySize = bytes.size() - kDigestSize;
    auto md = digest(bytes.data(), bodySize);
    if (!std::equal(md.begin(), md.end(), bytes.begin() + bodySize)) {
        throw CorruptStateError("State digest mismatch");
    }

    const uint8_t traversal = bytes[5];
    if (traversal != static_cast<uint8_t>(TraversalMode::Budget) &&
        traversal != static_cast<uint8_t>(TraversalMode::Rounds)) {
        throw CorruptStateError("Unknown traversal " + std::to_string(traversal));
    }
    if (bytes[6] != 0 || bytes[7] != 0) {
        throw CorruptStateError("Reserved header bytes are not zero");
    }

    DomainLayout layout;
    layout.domainSize = DataConverter::ReadUint64LE(&bytes[8]);
    layout.sectionSize = DataConverter::ReadUint64LE(&bytes[16]);
    layout.sectionCount = DataConverter::ReadUint64LE(&bytes[24]);
    const uint64_t cycles = DataConverter::ReadUint64LE(&bytes[32]);

    const uint64_t M = layout.sectionCount;
    if (M > bodySize / 8 || kHeaderSize + 8 * M + bitmapSize(M) != bodySize) {
        throw CorruptStateError("State blob length " + std::to_string(bytes.size()) +
            " does not match " + std::to_string(M) + " sections");
    }

    std::vector<uint64_t> cursors(M);
    const uint8_t* p = bytes.data() + kHeaderSize;
    for (uint64_t i = 0; i < M; ++i, p += 8) {
        cursors[i] = DataConverter::ReadUint64LE(p);
    }

    std::vector<bool> retired(M, false);
    for (uint64_t i = 0; i < M; ++i) {
        retired[i] = (p[i / 8] >> (i % 8)) & 1u;
    }
    if (M % 8 != 0 && (p[M / 8] >> (M % 8)) != 0) {
        throw CorruptStateError("Retired bitmap has bits set past the last section");
    }

    return PermutationState(layout, static_cast<TraversalMode>(traversal), cycles,
        std::move(cursors), std::move(retired));
}

PermutationState StateCodec::decode(const std::vector<uint8_t>& bytes,
    const DomainLayout& expected,
    TraversalMode expectedMode) {
    PermutationState state = decode(bytes);
    const DomainLayout& stored = state.layout();
    if (!(stored == expected)) {
        throw ConfigurationMismatchError("State was created for N=" + std::to_string(stored.domainSize) +
            " S=" + std::to_string(stored.sectionSize) + " M=" + std::to_string(stored.sectionCount) +
            ", configured N=" + std::to_string(expected.domainSize) +
            " S=" + std::to_string(expected.sectionSize) + " M=" + std::to_string(expected.sectionCount));
    }
    if (state.traversal() != expectedMode) {
        throw ConfigurationMismatchError("State uses traversal '" + toString(state.traversal()) +
            "', configured '" + toString(expectedMode) + "'");
    }
    return state;
}
