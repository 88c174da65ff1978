#include "modes.hpp"
#include "args.hpp"

#include "pathsweep/io/SequenceIO.hpp"
#include "pathsweep/io/SweepSource.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int run_simulate(int argc, char** argv) {
    const std::string out   = argValue(argc, argv, "out", "");
    const std::string shape = argValue(argc, argv, "shape", "square");

    if (out.empty()) {
        std::cerr << "[simulate] usage: pathsweep-cli simulate --out=FILE [--shape=triangle|square]\n";
        return 1;
    }

    try {
        pathsweep::SweepSource::Options o{};
        if      (shape == "triangle") o.shape = pathsweep::PathShape::Triangle;
        else if (shape == "square")   o.shape = pathsweep::PathShape::Square;
        else throw std::invalid_argument("--shape: expected triangle|square, got '" + shape + "'");

        o.tileW         = argValueInt   (argc, argv, "tilew",    o.tileW);
        o.tileH         = argValueInt   (argc, argv, "tileh",    o.tileH);
        o.side          = argValueInt   (argc, argv, "side",     o.side);
        o.framesPerEdge = argValueInt   (argc, argv, "per-edge", o.framesPerEdge);
        o.loops         = argValueInt   (argc, argv, "loops",    o.loops);
        o.closeLoop     = argHas        (argc, argv, "close");
        o.jitterSigma   = argValueDouble(argc, argv, "jitter",   o.jitterSigma);
        o.textureSigma  = argValueDouble(argc, argv, "blur",     o.textureSigma);
        o.seed          = static_cast<unsigned>(argValueInt(argc, argv, "seed", int(o.seed)));
        o.masterPath    = argValue      (argc, argv, "master",   "");

        std::cout << "[simulate] shape=" << shape << ", side=" << o.side
                  << ", per-edge=" << o.framesPerEdge << ", loops=" << o.loops
                  << ", jitter=" << o.jitterSigma << "\n";

        pathsweep::SweepSource src(o);
        const pathsweep::Sequence frames = src.takeAll();
        pathsweep::writeSequence(out, frames);

        std::cout << "[simulate] finished. total frames: " << frames.size() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[simulate] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
