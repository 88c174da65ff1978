#pragma once

#include <cstddef>
#include <cstdint>

namespace pathsweep {

/* How the correlation surface is evaluated. */
enum class CorrelationMethod : std::uint8_t {
    Direct = 0, // windowed dot products in double precision
    Fast   = 1  // cv::matchTemplate (TM_CCORR) on 32-bit floats
};

/* What to emit when a correlation surface has max == min. */
enum class DegeneratePolicy : std::uint8_t {
    Zero    = 0, // all-zero quantized frame
    MidGray = 1, // all-128 quantized frame
    Throw   = 2  // raise DegenerateSurface
};

/* What the sequence builder does when one frame pair fails. */
enum class PairFailurePolicy : std::uint8_t {
    FailFast = 0, // rethrow, no output
    SkipPair = 1  // log and drop the pair
};

/* Tunable constants of the correlation / classification pipeline.
   Passed by const reference to every stage. */
struct Config {
    // cross-correlation
    int templateMargin {25};                       // trimmed from each edge of 'current'
    CorrelationMethod method {CorrelationMethod::Direct};
    DegeneratePolicy degenerate {DegeneratePolicy::Zero};

    // peak search
    int peakRegion {50};                           // top-left square considered per frame
    int peakStride {4};                            // coarse grid step
    int peakBlock  {2};                            // summed block side

    // turn counting
    double turnThreshold {20.0};                   // px, Euclidean jump
    int triangleTurns {2};                         // turns => triangular

    // sequence builder
    PairFailurePolicy pairFailure {PairFailurePolicy::FailFast};
    std::size_t workerThreads {1};                 // 1 = sequential, 0 = OpenCV default
};

} // namespace pathsweep
