//====================================================================
// File: core/include/pathsweep/core/Frame.hpp
//====================================================================
#pragma once


#include <opencv2/core.hpp>

#include <span>
#include <cstdint>
#include <vector>


namespace pathsweep {


/// Pixel storage layouts the containers can carry.
enum class PixelFormat : std::uint8_t {
Gray8 = 0 ///< 8-bit grayscale, 1 byte per pixel
};


/// Ordered list of equal-sized CV_8UC1 frames (input video or correlation video).
using Sequence = std::vector<cv::Mat>;


/// Lightweight view of one stored frame.
struct Frame {
std::span<const std::uint8_t> data{}; ///< read-only pixel buffer
std::uint32_t width{0};
std::uint32_t height{0};
PixelFormat format{PixelFormat::Gray8};


/// Total byte size, used to check the buffer before reading/writing.
[[nodiscard]] std::size_t bytes() const noexcept {
switch (format) {
case PixelFormat::Gray8: return static_cast<std::size_t>(width) * height;
default: return 0;
}
}
};


/// Wrap a frame view as a cv::Mat header (no copy; the view must outlive it).
inline cv::Mat toGray8View(const Frame& f) {
CV_Assert(f.format == PixelFormat::Gray8);
CV_Assert(f.data.size() >= f.bytes());
return cv::Mat(static_cast<int>(f.height), static_cast<int>(f.width), CV_8UC1,
const_cast<std::uint8_t*>(f.data.data()));
}


/// View of a continuous CV_8UC1 matrix as a Frame.
inline Frame fromGray8(const cv::Mat& m) {
CV_Assert(m.type() == CV_8UC1 && m.isContinuous());
return Frame{
std::span<const std::uint8_t>(m.data, m.total()),
static_cast<std::uint32_t>(m.cols),
static_cast<std::uint32_t>(m.rows),
PixelFormat::Gray8
};
}


} // namespace pathsweep
