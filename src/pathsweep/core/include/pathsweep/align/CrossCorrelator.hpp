#pragma once
#include <opencv2/core.hpp>
#include "pathsweep/core/Config.hpp"

namespace pathsweep {

/** Result of correlating one frame pair. */
struct CorrelationResult {
    cv::Mat surface;       // CV_64F, raw scores, (H-Th) x (W-Tw)
    cv::Mat quantized;     // CV_8UC1, surface stretched to [0..255]
    double minScore{0.0};
    double maxScore{0.0};
    cv::Point bestOffset;  // (x=col, y=row) of maxScore
    bool degenerate{false};
};

/**
 * Zero-mean cross-correlation of 'prev' against the central template of 'curr'.
 * Both frames: CV_8UC1, same size, larger than 2*templateMargin on each axis.
 * Shared offset = mean of the two per-frame means (after scaling to [0..1]).
 * Throws ShapeMismatch on unequal/unsupported frames.
 */
CorrelationResult correlateFrames(const cv::Mat& prev_gray8,
                                  const cv::Mat& curr_gray8,
                                  const Config& cfg = {});

/** Same as correlateFrames(), returns only the quantized frame. */
cv::Mat correlateAdjacentFrames(const cv::Mat& prev_gray8,
                                const cv::Mat& curr_gray8,
                                const Config& cfg = {});

/** Affine stretch of a CV_64F surface to CV_8UC1, truncating toward zero.
    Applies cfg.degenerate when max == min. */
cv::Mat quantizeSurface(const cv::Mat& surface64f, const Config& cfg = {});

} // namespace pathsweep
