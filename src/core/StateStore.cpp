#include "core/StateStore.hpp"
#include "core/Errors.hpp"
#include "core/StateCodec.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

StateStore::StateStore(std::string path)
    : file(std::move(path)) {
    if (file.empty()) {
        throw ConfigurationError("State file path must not be empty");
    }
}

std::optional<std::vector<uint8_t>> StateStore::readBytes() const {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        if (ec) throw StateIoError("Cannot stat state file " + file + ": " + ec.message());
        return std::nullopt;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw CorruptStateError("State file " + file + " exists but cannot be opened");
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw CorruptStateError("Failed reading state file " + file);
    }
    return bytes;
}

std::optional<PermutationState> StateStore::load() const {
    auto bytes = readBytes();
    if (!bytes) return std::nullopt;
    return StateCodec::decode(*bytes);
}

std::optional<PermutationState> StateStore::load(const DomainLayout& expected, TraversalMode expectedMode) const {
    auto bytes = readBytes();
    if (!bytes) return std::nullopt;
    return StateCodec::decode(*bytes, expected, expectedMode);
}

void StateStore::save(const PermutationState& state) const {
    const auto bytes = StateCodec::encode(state);
    const std::string tmp = file + ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StateIoError("Cannot open " + tmp + " for writing");
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (out.fail()) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw StateIoError("Failed writing " + tmp);
        }
    }

    // the data is not fsynced; only the rename below is atomic
    std::error_code sizeEc;
    const auto written = fs::file_size(tmp, sizeEc);
    if (sizeEc || written != bytes.size()) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StateIoError("Short write to " + tmp);
    }

    std::error_code ec;
    fs::rename(tmp, file, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StateIoError("Cannot replace " + file + ": " + ec.message());
    }
}

bool StateStore::exists() const {
    std::error_code ec;
    return fs::exists(file, ec);
}

void StateStore::remove() const {
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        throw StateIoError("Cannot remove " + file + ": " + ec.message());
    }
}
