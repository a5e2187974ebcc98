#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>


namespace utils {


	class CSPRNG {
	public:
		virtual ~CSPRNG() = default;
		virtual std::vector<uint8_t> randomBytes(size_t size) = 0;
		virtual uint64_t randomUint64();
		// Uniform value in [0, bound). Throws std::invalid_argument for bound == 0.
		uint64_t randomBelow(uint64_t bound);
	};


	class OSCSPRNG : public CSPRNG {
	public:
		std::vector<uint8_t> randomBytes(size_t size) override;
	};


	// RAND_bytes from OpenSSL's default DRBG.
	class OpenSSLCSPRNG : public CSPRNG {
	public:
		std::vector<uint8_t> randomBytes(size_t size) override;
	};


	class TestCSPRNG : public CSPRNG {
	public:
		TestCSPRNG() = default;
		explicit TestCSPRNG(uint64_t seed) : state(seed) {}
		std::vector<uint8_t> randomBytes(size_t size) override;
	private:
		uint64_t state = 0xDEADBEEFCAFEBABEULL;
	};


} // namespace utils
