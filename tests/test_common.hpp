#pragma once
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <filesystem>
#include <string>

namespace testutil {

/* Smoothed-noise master image, 8-bit, full range. */
inline cv::Mat texture(int w, int h, unsigned seed, double sigma = 3.0) {
    cv::Mat f(h, w, CV_32F);
    cv::RNG rng(seed);
    rng.fill(f, cv::RNG::NORMAL, 0.0, 1.0);
    cv::GaussianBlur(f, f, {0,0}, sigma);
    double mn, mx; cv::minMaxLoc(f, &mn, &mx);
    cv::Mat u8;
    f.convertTo(u8, CV_8U, 255.0/(mx-mn), -mn*255.0/(mx-mn));
    return u8;
}

/* 160x160 crop of 'master' at (x, y). */
inline cv::Mat crop(const cv::Mat& master, int x, int y, int side = 160) {
    return master(cv::Rect(x, y, side, side)).clone();
}

inline bool identical(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

/* Fresh scratch directory under the system temp dir. */
inline std::filesystem::path scratchDir(const std::string& name) {
    auto p = std::filesystem::temp_directory_path() / ("pathsweep_" + name);
    std::filesystem::remove_all(p);
    std::filesystem::create_directories(p);
    return p;
}

} // namespace testutil
