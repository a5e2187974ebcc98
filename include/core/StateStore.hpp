#pragma once
#include <optional>
#include <string>
#include <core/PermutationState.hpp>

// File holding the encoded PermutationState between runs.
class StateStore {
public:
    explicit StateStore(std::string path);

    // Nothing when the file does not exist.
    std::optional<PermutationState> load() const;
    // Also checks that the stored state matches the configuration.
    std::optional<PermutationState> load(const DomainLayout& expected, TraversalMode expectedMode) const;

    // Writes <path>.tmp, checks it was closed with every byte on disk, and
    // renames it over <path>. The rename is atomic; the data is not fsynced,
    // so a power loss right after a save can still lose it.
    void save(const PermutationState& state) const;

    bool exists() const;
    void remove() const;

    const std::string& path() const { return file; }

private:
    std::optional<std::vector<uint8_t>> readBytes() const;

    std::string file;
};
