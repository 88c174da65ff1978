#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "pathsweep/classify/PathClassifier.hpp"
#include "pathsweep/core/SequenceBuilder.hpp"
#include "pathsweep/io/SequenceIO.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

struct BatchItem {
    const char* input;    // under --assets
    const char* output;   // under --outputs, without extension
};

// the fixed tree-cover sweeps
constexpr BatchItem kItems[] = {
    { "tree-cover-square-path-0.gif",   "test_s_0" },
    { "tree-cover-square-path-1.gif",   "test_s_1" },
    { "tree-cover-triangle-path-0.gif", "test_t_0" },
    { "tree-cover-triangle-path-1.gif", "test_t_1" },
};

} // namespace

int run_batch(int argc, char** argv) {
    const std::filesystem::path assets  = argValue(argc, argv, "assets", "assets");
    const std::filesystem::path outputs = argValue(argc, argv, "outputs", "outputs");
    const std::string ext               = argValue(argc, argv, "ext", "gif");

    try {
        const pathsweep::Config cfg = configFromArgs(argc, argv);

        for (const BatchItem& it : kItems) {
            const std::string in  = (assets / it.input).string();
            const std::string out = (outputs / (std::string(it.output) + "." + ext)).string();

            std::cout << "[batch] " << in << " -> " << out << "\n";
            const pathsweep::Sequence video = pathsweep::readSequence(in);

            pathsweep::FileSequenceSink sink(out);
            const pathsweep::Sequence corr = pathsweep::buildCorrelationSequence(video, cfg, &sink);
            std::cout << "[batch] correlation video: " << sink.path() << "\n";

            const pathsweep::PathAnalysis a = pathsweep::analyzePath(corr, cfg);
            print_analysis("batch", a, cfg, false);
        }
    } catch (const std::exception& e) {
        std::cerr << "[batch] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
