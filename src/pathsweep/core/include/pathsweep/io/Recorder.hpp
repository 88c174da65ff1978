#pragma once

#include "pathsweep/core/Frame.hpp"

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace pathsweep {

// Native lossless sequence container, PSQ1:
//
// Header:
//   char     magic[4] = 'P','S','Q','1'
//   uint32_t version  = 1
//
// One record per frame:
//   uint32_t width
//   uint32_t height
//   uint8_t  format (PixelFormat)
//   uint8_t  _pad[3] = {0,0,0}
//   uint64_t seq
//   uint32_t crc32   (zlib crc32 of data)
//   uint32_t data_size
//   uint8_t  data[data_size]
//
// All little-endian (as on x86/amd64).

class FrameRecorder {
public:
    explicit FrameRecorder(const std::string& path);
    ~FrameRecorder();

    bool ok() const noexcept { return ok_; }

    // Appends one frame; the CRC is computed here.
    bool write(const Frame& f, std::uint64_t seq);

private:
    std::ofstream ofs_;
    bool ok_{false};
};

class FramePlayer {
public:
    explicit FramePlayer(const std::string& path);
    ~FramePlayer();

    bool ok() const noexcept { return ok_; }

    // Reads the next frame; 'out' references 'scratch'.
    // Returns false at end of file. Truncated records and CRC mismatches
    // raise SequenceIoError.
    bool readNext(Frame& out, std::vector<std::uint8_t>& scratch,
                  std::uint64_t* out_seq = nullptr);

private:
    std::ifstream ifs_;
    bool ok_{false};
};

/* zlib crc32 of a byte range. */
std::uint32_t crc32Bytes(const void* data, std::size_t size);

} // namespace pathsweep
