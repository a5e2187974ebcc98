#include <CLI/CLI.hpp>
#include <glog/logging.h>
#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>

#include <core/CodeGenerator.hpp>
#include <core/Errors.hpp>
#include <core/rngFactory.hpp>
#include <core/selectorFactory.hpp>
#include <core/StateStore.hpp>

void printStatus(const GeneratorConfig& config) {
    const DomainLayout layout = config.layout();
    StateStore store(config.resolvedStatePath());

    std::cout << "state file : " << store.path() << "\n";
    std::cout << "domain     : " << layout.domainSize << " codes (" << config.hexDigits << " hex digits)\n";
    std::cout << "sections   : " << layout.sectionCount << " x " << layout.sectionSize << "\n";

    auto state = store.load(layout, config.traversal);
    if (!state) {
        std::cout << "progress   : no state yet\n";
        return;
    }
    std::cout << "traversal  : " << toString(state->traversal()) << "\n";
    std::cout << "cycle      : " << state->completedCycles() + 1 << "\n";
    std::cout << "progress   : " << state->emittedInCycle() << " / " << layout.domainSize << "\n";
    std::cout << "eligible   : " << state->eligibleCount() << " sections\n";
}

int main(int argc, char** argv) {
    CLI::App app{"codemint - unique one-time code generator"};

    GeneratorConfig config;
    std::string traversal = "budget";
    std::string selector = "weighted";
    std::string rng = "os";
    uint64_t seed = 0;
    size_t count = 1;
    bool noSave = false;
    bool status = false;
    bool reset = false;
    bool verbose = false;

    // Domain options
    app.add_option("--digits,-d", config.hexDigits, "Code width in hex digits")->check(CLI::Range(1, 15));
    app.add_option("--sections,-s", config.sectionCount, "Number of sections the domain is split into (default 1024, or one per value below 3 digits)");
    app.add_option("--section-size", config.sectionSize, "Values per section (overrides --sections)");
    app.add_option("--traversal", traversal, "Section retirement rule (budget, rounds)")
        ->check(CLI::IsMember({"budget", "rounds"}));

    // Selection options
    app.add_option("--selector", selector, "Section selection (weighted, uniform)")
        ->check(CLI::IsMember({"weighted", "uniform"}));
    app.add_option("--rng", rng, "Random source (os, openssl, test)")
        ->check(CLI::IsMember({"os", "openssl", "test"}));
    app.add_option("--seed", seed, "Seed for the test random source (only valid with --rng test)");

    // State options
    app.add_option("--state-file,-f", config.statePath, "State file (default dig_<digits>-div_<sections>.state)");
    app.add_flag("--no-save", noSave, "Do not write the state back");
    app.add_flag("--reset", reset, "Delete the state file before generating");
    app.add_flag("--status", status, "Print the state of the generator and exit");

    // Output options
    app.add_option("--count,-n", count, "Number of codes to generate")->check(CLI::PositiveNumber);
    app.add_flag("--uppercase,-u", config.uppercase, "Print codes in uppercase hex");
    app.add_flag("--verbose,-v", verbose, "Log every selection step");

    CLI11_PARSE(app, argc, argv);

    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1; // log only to console, no files.
    FLAGS_minloglevel = verbose ? 0 : 1; // INFO : WARNING
    FLAGS_v = verbose ? 1 : 0;

    try {
        config.traversal = traversalFromString(traversal);

        if (reset) {
            StateStore(config.resolvedStatePath()).remove();
        }
        if (status) {
            printStatus(config);
            return 0;
        }

        CodeGenerator gen(config, RngFactory::create(rng, seed), SelectorFactory::create(selector));

        if (count == 1) {
            std::cout << gen.generateCode(!noSave) << std::endl;
        } else if (noSave) {
            for (size_t i = 0; i < count; i++) {
                std::cout << gen.formatCode(gen.nextValue()) << "\n";
            }
        } else {
            for (const auto& code : gen.generateCodes(count)) {
                std::cout << code << "\n";
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
