#include "pathsweep/io/SweepSource.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pathsweep {

SweepSource::SweepSource()
    : SweepSource(Options{}) {}

SweepSource::SweepSource(const Options& opt)
    : opt_(opt)
{
    if (opt_.framesPerEdge < 1 || opt_.loops < 1 || opt_.side < 0) {
        throw std::invalid_argument("SweepSource: framesPerEdge and loops must be >= 1, side >= 0");
    }
    unsigned seed = opt_.seed ? opt_.seed : std::random_device{}();
    rng_.seed(seed);
    ensureMasterReady();
    buildPath();
}

void SweepSource::ensureMasterReady() {
    // 1) explicit master image
    if (!opt_.masterPath.empty()) {
        cv::Mat m = cv::imread(opt_.masterPath, cv::IMREAD_GRAYSCALE);
        if (m.empty()) {
            throw std::runtime_error("SweepSource: failed to load master image: " + opt_.masterPath);
        }
        master_ = m;
        return;
    }

    // 2) synthetic texture
    master_ = makeTexture(opt_.masterW, opt_.masterH);
}

cv::Mat SweepSource::makeTexture(int w, int h) {
    cv::Mat f(h, w, CV_32F);
    cv::RNG rng(opt_.seed ? opt_.seed : 0x5eedu);
    rng.fill(f, cv::RNG::NORMAL, 0.0, 1.0);        // white noise
    if (opt_.textureSigma > 0.0) {
        cv::GaussianBlur(f, f, {0,0}, opt_.textureSigma);
    }

    // stretch to the full 8-bit range
    double mn, mx; cv::minMaxLoc(f, &mn, &mx);
    cv::Mat base;
    if (mx > mn) {
        f.convertTo(base, CV_8U, 255.0/(mx-mn), -mn*255.0/(mx-mn));
    } else {
        base = cv::Mat(h, w, CV_8UC1, cv::Scalar(128));
    }
    return base;
}

void SweepSource::buildPath() {
    const int S = opt_.side;
    std::vector<cv::Point> rel;
    if (opt_.shape == PathShape::Triangle) {
        rel = { {0,0}, {S,0}, {S/2,S} };
    } else {
        rel = { {0,0}, {S,0}, {S,S}, {0,S} };
    }

    // center the path bounding box on the master
    const int ox = (master_.cols - opt_.tileW - S) / 2;
    const int oy = (master_.rows - opt_.tileH - S) / 2;
    if (ox < 0 || oy < 0) {
        throw std::invalid_argument("SweepSource: master image too small for tile + path");
    }
    vertices_.clear();
    for (const cv::Point& p : rel) vertices_.push_back({ox + p.x, oy + p.y});
}

int SweepSource::frameCount() const noexcept {
    const int perLoop = static_cast<int>(vertices_.size()) * opt_.framesPerEdge;
    return perLoop * opt_.loops + (opt_.closeLoop ? 1 : 0);
}

cv::Point SweepSource::viewportAt(int k) const {
    const int n = static_cast<int>(vertices_.size());
    const int perLoop = n * opt_.framesPerEdge;
    const int j = k % perLoop;
    const int edge = j / opt_.framesPerEdge;
    const int step = j % opt_.framesPerEdge;

    const cv::Point a = vertices_[edge];
    const cv::Point b = vertices_[(edge + 1) % n];
    const double t = double(step) / double(opt_.framesPerEdge);
    return { int(std::lround(a.x + t * (b.x - a.x))),
             int(std::lround(a.y + t * (b.y - a.y))) };
}

std::optional<Frame> SweepSource::next() {
    if (master_.empty() || curIdx_ >= frameCount()) return std::nullopt;

    const cv::Point base = viewportAt(curIdx_);
    double x0 = base.x, y0 = base.y;

    // jitter
    if (opt_.jitterSigma > 0.0) {
        x0 += opt_.jitterSigma * gauss_(rng_);
        y0 += opt_.jitterSigma * gauss_(rng_);
    }

    // keep the ROI inside the master
    const int W = master_.cols, H = master_.rows;
    const int tw = opt_.tileW, th = opt_.tileH;
    int x = std::max(0, std::min((int)std::lround(x0), W - tw));
    int y = std::max(0, std::min((int)std::lround(y0), H - th));

    cv::Mat patch = master_(cv::Rect{x, y, tw, th}).clone();
    scratch_.assign(patch.data, patch.data + (patch.rows * patch.cols));

    ++curIdx_;

    return Frame{
        std::span<const std::uint8_t>(scratch_.data(), scratch_.size()),
        static_cast<std::uint32_t>(patch.cols),
        static_cast<std::uint32_t>(patch.rows),
        PixelFormat::Gray8
    };
}

Sequence SweepSource::takeAll() {
    Sequence out;
    while (auto f = next()) {
        out.push_back(toGray8View(*f).clone());
    }
    return out;
}

} // namespace pathsweep
