#include "ExperimentConfiguration.h"
#include "ExperimentRunner.h"
#include "HypothesisTestException.h"

#include <cstdint>
#include <cstddef>
#include <iostream>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

void printUsage(const po::options_description& desc) {
    std::cout << "mcsig - Monte Carlo significance tests\n\n";
    std::cout << "Usage: mcsig [options] <experiment.json>\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Run every experiment of a file\n";
    std::cout << "  mcsig examples/thinkstats.json\n\n";
    std::cout << "  # Reproducible run on a private thread pool\n";
    std::cout << "  mcsig --seed 42 --executor threadpool examples/thinkstats.json\n\n";
    std::cout << "  # Cap the shared Boost thread pool\n";
    std::cout << "  ncpu=4 mcsig --executor boost examples/thinkstats.json\n";
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("experiments,e", po::value<std::string>(), "Experiment file (JSON)")
            ("iterations,n", po::value<std::int64_t>(), "Override the trial count of every experiment")
            ("seed,s", po::value<std::uint64_t>(), "Override the master seed of every experiment")
            ("executor,x", po::value<std::string>(), "Override the executor: single, threadpool, async, boost")
            ("policy,p", po::value<std::string>(), "Override the p-value policy: empirical, standard, wilson");

        po::positional_options_description positional;
        positional.add("experiments", 1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);

        if (vm.count("help") || !vm.count("experiments")) {
            printUsage(desc);
            return vm.count("help") ? 0 : 1;
        }

        std::vector<mcsig::ExperimentConfiguration> experiments =
            mcsig::ExperimentConfigurationReader::readFile(vm["experiments"].as<std::string>());

        mcsig::ExperimentOverrides overrides;
        if (vm.count("iterations")) {
            overrides.iterations = vm["iterations"].as<std::int64_t>();
        }
        if (vm.count("seed")) {
            overrides.seed = vm["seed"].as<std::uint64_t>();
        }
        if (vm.count("executor")) {
            overrides.executor = vm["executor"].as<std::string>();
        }
        if (vm.count("policy")) {
            overrides.pValuePolicy = vm["policy"].as<std::string>();
        }
        mcsig::applyOverrides(experiments, overrides);

        mcsig::ExperimentRunner runner;
        std::size_t failures = 0;

        for (const auto& experiment : experiments) {
            try {
                const mcsig::ExperimentReport report = runner.run(experiment);
                mcsig::printReport(std::cout, report);
                std::cout << std::endl;
            } catch (const mcsig::HypothesisTestException& e) {
                std::cerr << "Error: experiment " << experiment.getName() << ": " << e.what() << std::endl;
                ++failures;
            } catch (const std::domain_error& e) {
                std::cerr << "Error: experiment " << experiment.getName() << ": " << e.what() << std::endl;
                ++failures;
            } catch (const std::bad_alloc& e) {
                std::cerr << "Error: experiment " << experiment.getName() << ": out of memory (" << e.what()
                          << ")" << std::endl;
                ++failures;
            }
        }

        if (failures > 0) {
            std::cerr << failures << " of " << experiments.size() << " experiments failed" << std::endl;
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
