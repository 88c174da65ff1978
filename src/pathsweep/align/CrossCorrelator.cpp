#include "pathsweep/align/CrossCorrelator.hpp"
#include "pathsweep/core/Errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>

namespace pathsweep {

/* Convert an 8-bit grayscale image (CV_8UC1) to 64-bit float [0..1]. */
static cv::Mat to64f(const cv::Mat& m8) {
    CV_Assert(m8.type() == CV_8UC1);
    cv::Mat f; m8.convertTo(f, CV_64F, 1.0/255.0);
    return f;
}

static std::string sizeStr(const cv::Mat& m) {
    return std::to_string(m.cols) + "x" + std::to_string(m.rows);
}

static void checkPair(const cv::Mat& a, const cv::Mat& b, int margin) {
    if (a.empty() || b.empty())
        throw ShapeMismatch("correlateFrames: empty frame");
    if (a.type() != CV_8UC1 || b.type() != CV_8UC1)
        throw ShapeMismatch("correlateFrames: frames must be 8-bit single channel");
    if (a.size() != b.size())
        throw ShapeMismatch("correlateFrames: frame sizes differ (" + sizeStr(a) + " vs " + sizeStr(b) + ")");
    if (margin <= 0 || a.rows <= 2*margin || a.cols <= 2*margin)
        throw ShapeMismatch("correlateFrames: frame " + sizeStr(a) +
                            " too small for template margin " + std::to_string(margin));
}

/* Score at every offset: sum(templ .* prev(window)), window = templ size.
   Offsets cover (prev - templ) rows/cols starting at 0. */
static cv::Mat correlateDirect(const cv::Mat& prev64, const cv::Mat& templ64) {
    const int rows = prev64.rows - templ64.rows;
    const int cols = prev64.cols - templ64.cols;
    cv::Mat out(rows, cols, CV_64F);
    for (int r = 0; r < rows; ++r) {
        double* o = out.ptr<double>(r);
        for (int c = 0; c < cols; ++c) {
            cv::Mat win = prev64(cv::Rect(c, r, templ64.cols, templ64.rows));
            o[c] = templ64.dot(win);
        }
    }
    return out;
}

/* Same scores through cv::matchTemplate; it yields one extra row/col
   (the last offset), which is cropped away. */
static cv::Mat correlateFast(const cv::Mat& prev64, const cv::Mat& templ64) {
    const int rows = prev64.rows - templ64.rows;
    const int cols = prev64.cols - templ64.cols;
    cv::Mat a32, t32, res;
    prev64.convertTo(a32, CV_32F);
    templ64.convertTo(t32, CV_32F);
    cv::matchTemplate(a32, t32, res, cv::TM_CCORR);
    cv::Mat out;
    res(cv::Rect(0, 0, cols, rows)).convertTo(out, CV_64F);
    return out;
}

/* max == min, up to summation-order noise (relative 1e-9). */
static bool isDegenerate(double mn, double mx) {
    return !(mx - mn > 1e-9 * std::max(std::abs(mn), std::abs(mx)));
}

cv::Mat quantizeSurface(const cv::Mat& surface64f, const Config& cfg) {
    CV_Assert(surface64f.type() == CV_64F && !surface64f.empty());

    double mn = 0.0, mx = 0.0;
    cv::minMaxLoc(surface64f, &mn, &mx);

    if (isDegenerate(mn, mx)) {
        switch (cfg.degenerate) {
            case DegeneratePolicy::Throw:
                throw DegenerateSurface("quantizeSurface: surface is constant (" + std::to_string(mx) + ")");
            case DegeneratePolicy::MidGray:
                std::cerr << "[correlate] degenerate surface, emitting mid-gray frame\n";
                return cv::Mat(surface64f.size(), CV_8UC1, cv::Scalar(128));
            case DegeneratePolicy::Zero:
            default:
                std::cerr << "[correlate] degenerate surface, emitting zero frame\n";
                return cv::Mat::zeros(surface64f.size(), CV_8UC1);
        }
    }

    // (v - min) / (max - min) * 255, truncated (no rounding); max -> exactly 255
    const double range = mx - mn;
    cv::Mat out(surface64f.size(), CV_8UC1);
    for (int r = 0; r < surface64f.rows; ++r) {
        const double* s = surface64f.ptr<double>(r);
        std::uint8_t* o = out.ptr<std::uint8_t>(r);
        for (int c = 0; c < surface64f.cols; ++c) {
            double v = (s[c] - mn) / range * 255.0;
            if (v < 0.0) v = 0.0;
            if (v > 255.0) v = 255.0;
            o[c] = static_cast<std::uint8_t>(v);
        }
    }
    return out;
}

/*
  Correlate two adjacent frames.

  Steps:
    1) Scale both frames to [0..1] (CV_64F).
    2) Shared offset = (mean(prev) + mean(curr)) / 2, subtracted from both.
       (midpoint of the two means, not the pooled mean).
    3) Template = curr trimmed by 'templateMargin' on every edge.
    4) Valid cross-correlation of prev with the template.
    5) Stretch the surface to 8 bits.
*/
CorrelationResult correlateFrames(const cv::Mat& prev_gray8,
                                  const cv::Mat& curr_gray8,
                                  const Config& cfg)
{
    checkPair(prev_gray8, curr_gray8, cfg.templateMargin);

    cv::Mat A = to64f(prev_gray8);
    cv::Mat B = to64f(curr_gray8);

    const double offset = 0.5 * (cv::mean(A)[0] + cv::mean(B)[0]);
    A -= offset;
    B -= offset;

    const int M = cfg.templateMargin;
    cv::Mat templ = B(cv::Rect(M, M, B.cols - 2*M, B.rows - 2*M));

    CorrelationResult out;
    out.surface = (cfg.method == CorrelationMethod::Fast)
                      ? correlateFast(A, templ)
                      : correlateDirect(A, templ);

    cv::minMaxLoc(out.surface, &out.minScore, &out.maxScore, nullptr, &out.bestOffset);
    out.degenerate = isDegenerate(out.minScore, out.maxScore);
    out.quantized = quantizeSurface(out.surface, cfg);
    return out;
}

cv::Mat correlateAdjacentFrames(const cv::Mat& prev_gray8,
                                const cv::Mat& curr_gray8,
                                const Config& cfg)
{
    return correlateFrames(prev_gray8, curr_gray8, cfg).quantized;
}

} // namespace pathsweep
