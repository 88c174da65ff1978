#include "utils.hpp"
#include "args.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>

pathsweep::Config configFromArgs(int argc, char** argv) {
    pathsweep::Config cfg{};

    cfg.templateMargin = argValueInt(argc, argv, "margin", cfg.templateMargin);

    const std::string method = argValue(argc, argv, "method", "direct");
    if      (method == "direct") cfg.method = pathsweep::CorrelationMethod::Direct;
    else if (method == "fast")   cfg.method = pathsweep::CorrelationMethod::Fast;
    else throw std::invalid_argument("--method: expected direct|fast, got '" + method + "'");

    const std::string deg = argValue(argc, argv, "degenerate", "zero");
    if      (deg == "zero")  cfg.degenerate = pathsweep::DegeneratePolicy::Zero;
    else if (deg == "mid")   cfg.degenerate = pathsweep::DegeneratePolicy::MidGray;
    else if (deg == "throw") cfg.degenerate = pathsweep::DegeneratePolicy::Throw;
    else throw std::invalid_argument("--degenerate: expected zero|mid|throw, got '" + deg + "'");

    if (argHas(argc, argv, "skip-bad")) cfg.pairFailure = pathsweep::PairFailurePolicy::SkipPair;
    cfg.workerThreads = static_cast<std::size_t>(std::max(0, argValueInt(argc, argv, "threads", 1)));

    cfg.peakRegion    = argValueInt   (argc, argv, "region",    cfg.peakRegion);
    cfg.peakStride    = argValueInt   (argc, argv, "stride",    cfg.peakStride);
    cfg.peakBlock     = argValueInt   (argc, argv, "block",     cfg.peakBlock);
    cfg.turnThreshold = argValueDouble(argc, argv, "threshold", cfg.turnThreshold);
    cfg.triangleTurns = argValueInt   (argc, argv, "turns",     cfg.triangleTurns);

    if (cfg.peakStride < 1 || cfg.peakBlock < 1 || cfg.peakRegion < 0) {
        throw std::invalid_argument("--stride and --block must be >= 1, --region >= 0");
    }
    return cfg;
}

/*
  Prepare an image for on-screen display.

  - Expects CV_8UC1 (8-bit grayscale). If the type is different,
    we simply clone and return it unchanged.
  - If the image has no contrast (max <= min), return as-is.
  - Otherwise, linearly rescale pixel values to [0..255].
*/
cv::Mat displayize(const cv::Mat& src8u) {
    if (src8u.empty()) return {};
    if (src8u.type() != CV_8UC1) return src8u.clone();

    double mn, mx;
    cv::minMaxLoc(src8u, &mn, &mx);
    if (mx <= mn) return src8u;

    cv::Mat dst;
    src8u.convertTo(dst, CV_8U, 255.0 / (mx - mn), -mn * 255.0 / (mx - mn));
    return dst;
}

void view_sequence(const pathsweep::Sequence& seq, const std::string& title,
                   int delayMs, int zoom)
{
    if (seq.empty()) {
        std::cout << "[view] nothing to show\n";
        return;
    }
    try {
        cv::namedWindow(title, cv::WINDOW_NORMAL);
    } catch (const cv::Exception& e) {
        std::cerr << "[view] failed to create window (" << e.what() << "); skipping viewer\n";
        return;
    }

    for (std::size_t i = 0; i < seq.size(); ++i) {
        cv::Mat shown;
        cv::resize(displayize(seq[i]), shown, cv::Size(), zoom, zoom, cv::INTER_NEAREST);
        cv::imshow(title, shown);
        int k = cv::waitKey(std::max(1, delayMs));
        if (k==27 || k=='q' || k=='Q') break;
    }
    cv::destroyWindow(title);
}

void print_analysis(const std::string& tag, const pathsweep::PathAnalysis& a,
                    const pathsweep::Config& cfg, bool verbose)
{
    if (verbose) {
        for (std::size_t i = 0; i < a.peaks.size(); ++i) {
            std::cout << "[" << tag << "] frame " << std::setw(3) << i
                      << "  peak=(" << a.peaks[i].row << "," << a.peaks[i].col << ")"
                      << "  sum=" << a.peaks[i].blockSum;
            if (i > 0) {
                const double d = a.jumps[i-1];
                std::cout << "  jump=" << std::fixed << std::setprecision(2) << d
                          << std::defaultfloat << (d > cfg.turnThreshold ? "  <turn>" : "");
            }
            std::cout << "\n";
        }
    }
    std::cout << "[" << tag << "] frames=" << a.peaks.size()
              << " turns=" << a.turns
              << " shape=" << pathsweep::toString(a.shape())
              << (a.sufficientFrames ? "" : " (too few frames)") << "\n";
}
