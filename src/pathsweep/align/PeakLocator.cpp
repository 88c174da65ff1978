#include "pathsweep/align/PeakLocator.hpp"

#include <algorithm>
#include <cmath>

namespace pathsweep {

/* Sum of the block [r, r+n) x [c, c+n) clipped to 'region'. */
static long long blockSumClipped(const cv::Mat& region, int r, int c, int n) {
    const int r1 = std::min(r + n, region.rows);
    const int c1 = std::min(c + n, region.cols);
    long long s = 0;
    for (int y = r; y < r1; ++y) {
        const std::uint8_t* p = region.ptr<std::uint8_t>(y);
        for (int x = c; x < c1; ++x) s += p[x];
    }
    return s;
}

PeakLocation locatePeak(const cv::Mat& corr_gray8, const Config& cfg) {
    CV_Assert(corr_gray8.type() == CV_8UC1);
    CV_Assert(cfg.peakStride > 0 && cfg.peakBlock > 0 && cfg.peakRegion >= 0);

    const int rh = std::min(cfg.peakRegion, corr_gray8.rows);
    const int rw = std::min(cfg.peakRegion, corr_gray8.cols);
    const cv::Mat region = corr_gray8(cv::Rect(0, 0, rw, rh));

    PeakLocation best{};
    // the scan range is inclusive of peakRegion; candidates past the clipped
    // region sum to zero and never win
    for (int r = 0; r <= cfg.peakRegion; r += cfg.peakStride) {
        for (int c = 0; c <= cfg.peakRegion; c += cfg.peakStride) {
            if (r >= rh || c >= rw) continue;
            const long long s = blockSumClipped(region, r, c, cfg.peakBlock);
            if (s > best.blockSum) {
                best.blockSum = s;
                best.row = r;
                best.col = c;
            }
        }
    }
    return best;
}

double peakDistance(const PeakLocation& a, const PeakLocation& b) noexcept {
    const double dr = double(a.row - b.row);
    const double dc = double(a.col - b.col);
    return std::sqrt(dr*dr + dc*dc);
}

} // namespace pathsweep
