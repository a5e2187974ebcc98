#include <chrono>
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <cstring>
#include <cstdio>
#include <iomanip>
#include <memory>

#include <glog/logging.h>

#include "core/CodeGenerator.hpp"
#include "core/rngFactory.hpp"
#include "core/selectorFactory.hpp"

using Clock = std::chrono::high_resolution_clock;

struct BenchResult {
    std::string rng;
    std::string persistence;
    unsigned digits;
    uint64_t sections;
    size_t codes;
    double codes_per_sec;
    double usec_per_code;
};

BenchResult bench_generator(const std::string& rngName,
    bool savePerCode,
    unsigned digits,
    uint64_t sections,
    size_t codes)
{
    GeneratorConfig config;
    config.hexDigits = digits;
    config.sectionCount = sections;
    config.statePath = "bench_" + std::to_string(digits) + "_" + std::to_string(sections) + ".state";
    std::remove(config.statePath.c_str());

    CodeGenerator gen(config, RngFactory::create(rngName), SelectorFactory::create("weighted"));

    // Warmup
    gen.generateCode(false);

    auto start = Clock::now();
    if (savePerCode) {
        for (size_t i = 0; i < codes; ++i) {
            gen.generateCode(true);
        }
    } else {
        gen.generateCodes(codes);
    }
    auto end = Clock::now();

    std::remove(config.statePath.c_str());

    auto dur = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    double seconds = dur / 1e6;
    double codes_per_sec = seconds > 0 ? static_cast<double>(codes) / seconds : 0.0;
    double usec_per_code = static_cast<double>(dur) / codes;

    return { rngName, savePerCode ? "per-code" : "batch", digits, sections, codes, codes_per_sec, usec_per_code };
}

int main(int argc, char** argv)
{
    std::string outFile = "bench_results.csv";
    size_t codes = 10000;

    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1; // log only to console, no files.
    FLAGS_minloglevel = 1; // WARNING

    // Parse CLI args
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            outFile = argv[++i];
        } else if (std::strcmp(argv[i], "--codes") == 0 && i + 1 < argc) {
            codes = std::stoul(argv[++i]);
        }
    }
    if (codes == 0) {
        std::cerr << "--codes must be greater than zero\n";
        return 1;
    }

    struct Domain { unsigned digits; uint64_t sections; };
    std::vector<Domain> domains = { {4, 256}, {6, 2048}, {8, 1024}, {8, 4096} };
    std::vector<BenchResult> results;

    std::cerr << "[*] Starting benchmarks (codes=" << codes << ")...\n";

    for (auto d : domains) {
        for (const char* rng : { "os", "openssl" }) {
            std::cerr << "[*] " << rng << " digits=" << d.digits << " sections=" << d.sections << " batch\n";
            results.push_back(bench_generator(rng, false, d.digits, d.sections, codes));
            std::cerr << "[*] " << rng << " digits=" << d.digits << " sections=" << d.sections << " per-code\n";
            results.push_back(bench_generator(rng, true, d.digits, d.sections, codes));
        }
    }

    // Write CSV
    std::ofstream ofs(outFile);
    ofs << "rng,persistence,digits,sections,codes,codes_per_sec,latency_usec\n";
    for (auto& r : results) {
        ofs << r.rng << ","
            << r.persistence << ","
            << r.digits << ","
            << r.sections << ","
            << r.codes << ","
            << std::fixed << std::setprecision(2) << r.codes_per_sec << ","
            << std::fixed << std::setprecision(2) << r.usec_per_code << "\n";
    }

    // Print summary to console
    std::cerr << "\n[*] Results saved to " << outFile << "\n";
    std::cerr << "\n=== Summary ===\n";
    std::cerr << std::left << std::setw(9) << "RNG"
              << std::setw(10) << "Persist"
              << std::setw(8) << "Digits"
              << std::setw(10) << "Sections"
              << std::setw(18) << "Throughput"
              << "Latency\n";
    std::cerr << std::string(64, '-') << "\n";
    for (auto& r : results) {
        std::cerr << std::left << std::setw(9) << r.rng
                  << std::setw(10) << r.persistence
                  << std::setw(8) << r.digits
                  << std::setw(10) << r.sections
                  << std::fixed << std::setprecision(2)
                  << std::setw(10) << r.codes_per_sec << " codes/s"
                  << std::setw(10) << r.usec_per_code << " us\n";
    }

    return 0;
}
