#pragma once
#include "pathsweep/align/PeakLocator.hpp"
#include "pathsweep/core/Config.hpp"
#include "pathsweep/core/Frame.hpp"

#include <string>
#include <vector>

namespace pathsweep {

/** Path shapes the sweep heuristic separates. */
enum class PathShape { Triangle, Square };

const char* toString(PathShape s) noexcept;

/** Per-sequence trace of the turn-counting heuristic. */
struct PathAnalysis {
    std::vector<PeakLocation> peaks;   // one per correlation frame
    std::vector<double> jumps;         // peaks[i] - peaks[i-1], i >= 1
    int turns{0};                      // jumps > cfg.turnThreshold
    bool sufficientFrames{false};      // >= 3 correlation frames
    bool triangular{false};

    PathShape shape() const noexcept { return triangular ? PathShape::Triangle : PathShape::Square; }
};

/**
 * Run the turn counter over an already built correlation sequence.
 * triangular == (turns == cfg.triangleTurns). With fewer than 3 correlation
 * frames the result is not meaningful: sufficientFrames is false,
 * triangular is false and a warning is logged.
 */
PathAnalysis analyzePath(const Sequence& correlation, const Config& cfg = {});

/** Build the correlation sequence of 'video' and classify it (true = triangle). */
bool isTriangularPath(const Sequence& video, const Config& cfg = {});

} // namespace pathsweep
