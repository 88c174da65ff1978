#include "pathsweep/classify/PathClassifier.hpp"
#include "pathsweep/core/SequenceBuilder.hpp"

#include <iostream>

/*
  Triangle / square classification of a camera sweep.

  Each correlation frame has a bright blob where the template of frame i+1
  matches frame i; its position follows the apparent translation between
  the two frames. While the camera moves along a straight edge the blob
  stays put; at a corner of the path it jumps. A triangle has fewer corners
  inside the sequence than a square, so the number of large jumps separates
  the two.

  The rule is a heuristic tuned on clean synthetic sweeps.
*/

namespace pathsweep {

const char* toString(PathShape s) noexcept {
    switch (s) {
        case PathShape::Triangle: return "triangle";
        case PathShape::Square:   return "square";
    }
    return "?";
}

PathAnalysis analyzePath(const Sequence& correlation, const Config& cfg) {
    PathAnalysis out;
    out.peaks.reserve(correlation.size());
    out.sufficientFrames = correlation.size() >= 3;

    for (const cv::Mat& f : correlation) {
        const PeakLocation p = locatePeak(f, cfg);
        if (!out.peaks.empty()) {
            const double d = peakDistance(p, out.peaks.back());
            out.jumps.push_back(d);
            if (d > cfg.turnThreshold) ++out.turns;
        }
        out.peaks.push_back(p);
    }

    if (!out.sufficientFrames) {
        std::cerr << "[classify] " << correlation.size()
                  << " correlation frame(s); at least 3 are needed to observe turns, "
                  << "reporting non-triangular\n";
        out.triangular = false;
        return out;
    }

    out.triangular = (out.turns == cfg.triangleTurns);
    return out;
}

bool isTriangularPath(const Sequence& video, const Config& cfg) {
    return analyzePath(buildCorrelationSequence(video, cfg), cfg).triangular;
}

} // namespace pathsweep
