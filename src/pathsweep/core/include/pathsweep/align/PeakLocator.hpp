#pragma once
#include <opencv2/core.hpp>
#include "pathsweep/core/Config.hpp"

namespace pathsweep {

/** Coarse peak of one quantized correlation frame. */
struct PeakLocation {
    int row{0};
    int col{0};
    long long blockSum{0};   // summed intensity of the winning block (0 if none)
};

/**
 * Coarse peak search on a CV_8UC1 correlation frame.
 * Only the top-left cfg.peakRegion square is considered (clipped to the frame).
 * Candidates: every cfg.peakStride over [0..peakRegion] on both axes, rows outer.
 * Score: sum of the peakBlock x peakBlock block at the candidate; samples
 * outside the region contribute zero. Only a strictly greater score replaces
 * the running best, which starts at (0,0) with score 0.
 */
PeakLocation locatePeak(const cv::Mat& corr_gray8, const Config& cfg = {});

/** Euclidean distance between two peak locations. */
double peakDistance(const PeakLocation& a, const PeakLocation& b) noexcept;

} // namespace pathsweep
