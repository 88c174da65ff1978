#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "pathsweep/core/SequenceBuilder.hpp"
#include "pathsweep/io/SequenceIO.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

int run_correlate(int argc, char** argv) {
    const std::string in   = argValue(argc, argv, "in", "");
    const std::string out  = argValue(argc, argv, "out", "");
    const bool withView    = argHas(argc, argv, "view");

    if (in.empty()) {
        std::cerr << "[correlate] usage: pathsweep-cli correlate --in=FILE [--out=FILE] [--view]\n";
        return 1;
    }

    try {
        const pathsweep::Config cfg = configFromArgs(argc, argv);
        const pathsweep::Sequence video = pathsweep::readSequence(in);

        std::unique_ptr<pathsweep::FileSequenceSink> sink;
        if (!out.empty()) sink = std::make_unique<pathsweep::FileSequenceSink>(out);

        const auto t0 = std::chrono::steady_clock::now();
        const pathsweep::Sequence corr = pathsweep::buildCorrelationSequence(video, cfg, sink.get());
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - t0).count();

        std::cout << "[correlate] " << corr.size() << " correlation frame(s)";
        if (!corr.empty()) std::cout << " of " << corr[0].cols << "x" << corr[0].rows;
        std::cout << " in " << ms << " ms\n";

        if (withView) {
            view_sequence(video, "pathsweep input", argValueInt(argc, argv, "delay", 120), 2);
            view_sequence(corr, "pathsweep correlation", argValueInt(argc, argv, "delay", 120), 6);
        }
    } catch (const std::exception& e) {
        std::cerr << "[correlate] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
