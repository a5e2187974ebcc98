#include "utils/RNG.hpp"
#include <openssl/rand.h>
#include <limits>
#include <random>
#include <stdexcept>

namespace utils {

	uint64_t CSPRNG::randomUint64() {
		auto bytes = randomBytes(8);
		uint64_t val = 0;
		for (int i = 0; i < 8; i++) {
			val = (val << 8) | bytes[i];
		}
		return val;
	}

	uint64_t CSPRNG::randomBelow(uint64_t bound) {
		if (bound == 0)
			throw std::invalid_argument("randomBelow: bound must be greater than zero");

		// odrzucamy ogon, ktory nie dzieli sie rowno przez bound
		const uint64_t limit = std::numeric_limits<uint64_t>::max() - (std::numeric_limits<uint64_t>::max() % bound);
		uint64_t val = randomUint64();
		while (val >= limit) {
			val = randomUint64();
		}
		return val % bound;
	}

	std::vector<uint8_t> OSCSPRNG::randomBytes(size_t size) {
		std::vector<uint8_t> data(size);
		// NOTE: std::random_device may not be cryptographically secure on all platforms
		std::random_device rd;
		size_t i = 0;
		while (i < size) {
			uint32_t val = rd();
			for (int b = 0; b < 4 && i < size; b++, i++) {
				data[i] = (val >> (b * 8)) & 0xFF;
			}
		}
		return data;
	}

	std::vector<uint8_t> OpenSSLCSPRNG::randomBytes(size_t size) {
		std::vector<uint8_t> data(size);
		if (size == 0)
			return data;
		if (RAND_bytes(data.data(), static_cast<int>(size)) != 1) {
			throw std::runtime_error("RAND_bytes failed");
		}
		return data;
	}

	std::vector<uint8_t> TestCSPRNG::randomBytes(size_t size) {
		std::vector<uint8_t> data(size);
		for (size_t i = 0;i < size;i++) {
			state = state * 6364136223846793005ULL + 1;
			data[i] = (state >> 32) & 0xFF;
		}
		return data;
	}

	
} // namespace utils
