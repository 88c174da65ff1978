#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "pathsweep/classify/PathClassifier.hpp"
#include "pathsweep/core/SequenceBuilder.hpp"
#include "pathsweep/io/SequenceIO.hpp"

#include <iostream>
#include <string>

int run_classify(int argc, char** argv) {
    const std::string in = argValue(argc, argv, "in", "");
    const bool verbose   = argHas(argc, argv, "verbose");

    if (in.empty()) {
        std::cerr << "[classify] usage: pathsweep-cli classify --in=FILE [--threshold=20] [--verbose]\n";
        return 1;
    }

    try {
        const pathsweep::Config cfg = configFromArgs(argc, argv);
        const pathsweep::Sequence video = pathsweep::readSequence(in);
        const pathsweep::Sequence corr  = pathsweep::buildCorrelationSequence(video, cfg);
        const pathsweep::PathAnalysis a = pathsweep::analyzePath(corr, cfg);

        print_analysis("classify", a, cfg, verbose);
        std::cout << (a.triangular ? "true" : "false") << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[classify] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
