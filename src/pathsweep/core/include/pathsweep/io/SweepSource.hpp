#pragma once
#include "pathsweep/classify/PathClassifier.hpp"
#include "pathsweep/core/Frame.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace pathsweep {

/**
 * Frame source that pans a viewport over a master image (loaded from disk
 * or a synthetic texture) along a closed triangular or square path.
 *
 * Frames are placed at 'framesPerEdge' even steps per edge, starting at the
 * first vertex, so every corner of the path falls exactly on a frame.
 *
 * Vertices, relative to the path origin (x right, y down), side = S:
 *   square   : (0,0) (S,0) (S,S) (0,S)
 *   triangle : (0,0) (S,0) (S/2,S)
 */
class SweepSource {
public:
    struct Options {
        int    tileW = 160, tileH = 160;       // frame size
        PathShape shape = PathShape::Square;
        int    side = 48;                      // path side, px
        int    framesPerEdge = 3;              // steps per edge
        int    loops = 1;                      // full laps
        bool   closeLoop = false;              // emit the final return-to-start frame
        double jitterSigma = 0.0;              // RMS viewport jitter, px
        int    masterW = 512, masterH = 512;   // synthetic scene size
        double textureSigma = 3.0;             // blur of the synthetic texture
        unsigned seed = 1;                     // RNG seed (0 = random)
        std::string masterPath{};              // if set, load this image as master
    };

    explicit SweepSource(const Options& opt);
    SweepSource();

    std::optional<Frame> next();               // next frame, nullopt when done

    /// Remaining frames as deep copies.
    Sequence takeAll();

    /// Number of frames the path yields in total.
    int frameCount() const noexcept;

    /// Viewport top-left (x, y) of frame k in master coordinates, before jitter.
    cv::Point viewportAt(int k) const;

private:
    Options opt_;
    cv::Mat master_;                           // 8UC1
    std::vector<cv::Point> vertices_;          // absolute, master coordinates
    std::vector<std::uint8_t> scratch_;

    int curIdx_ = 0;
    std::mt19937 rng_;
    std::normal_distribution<double> gauss_{0.0, 1.0};

    void ensureMasterReady();
    void buildPath();
    cv::Mat makeTexture(int w, int h);         // 8UC1
};

} // namespace pathsweep
