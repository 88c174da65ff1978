#include "pathsweep/io/Recorder.hpp"
#include "pathsweep/core/Errors.hpp"

#include <zlib.h>

#include <cstring>

namespace pathsweep {

namespace {
#pragma pack(push, 1)
struct FileHeader {
    char     magic[4];   // 'P','S','Q','1'
    uint32_t version;    // 1
};
struct RecordHeader {
    uint32_t width;         // 4
    uint32_t height;        // 4
    uint8_t  format;        // 1
    uint8_t  pad[3];        // 3
    uint64_t seq;           // 8
    uint32_t crc32;         // 4
    uint32_t data_size;     // 4
}; // 28 bytes with pack(1)
#pragma pack(pop)

static_assert(sizeof(FileHeader)   == 8,  "FileHeader size unexpected");
static_assert(sizeof(RecordHeader) == 28, "RecordHeader size unexpected");

} // namespace

std::uint32_t crc32Bytes(const void* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    return static_cast<std::uint32_t>(crc);
}

//---------------- FrameRecorder ----------------

FrameRecorder::FrameRecorder(const std::string& path)
    : ofs_(path, std::ios::binary)
{
    if (!ofs_) return;

    FileHeader h{};
    h.magic[0] = 'P'; h.magic[1] = 'S'; h.magic[2] = 'Q'; h.magic[3] = '1';
    h.version  = 1u;
    ofs_.write(reinterpret_cast<const char*>(&h), sizeof(h));
    ok_ = static_cast<bool>(ofs_);
}

FrameRecorder::~FrameRecorder() = default;

bool FrameRecorder::write(const Frame& f, std::uint64_t seq)
{
    if (!ok_) return false;
    if (f.data.size() < f.bytes()) return false;

    RecordHeader rh{};
    rh.width        = f.width;
    rh.height       = f.height;
    rh.format       = static_cast<std::uint8_t>(f.format);
    rh.pad[0] = rh.pad[1] = rh.pad[2] = 0;
    rh.seq          = seq;
    rh.data_size    = static_cast<std::uint32_t>(f.bytes());
    rh.crc32        = crc32Bytes(f.data.data(), rh.data_size);

    ofs_.write(reinterpret_cast<const char*>(&rh), sizeof(rh));
    if (!ofs_) return false;

    if (rh.data_size) {
        ofs_.write(reinterpret_cast<const char*>(f.data.data()), rh.data_size);
        if (!ofs_) return false;
    }
    ofs_.flush();
    return static_cast<bool>(ofs_);
}

//---------------- FramePlayer ----------------

FramePlayer::FramePlayer(const std::string& path)
    : ifs_(path, std::ios::binary)
{
    if (!ifs_) return;
    FileHeader h{};
    ifs_.read(reinterpret_cast<char*>(&h), sizeof(h));
    if (!ifs_) return;
    if (std::memcmp(h.magic, "PSQ1", 4) != 0 || h.version != 1u) {
        return;
    }
    ok_ = true;
}

FramePlayer::~FramePlayer() = default;

bool FramePlayer::readNext(Frame& out, std::vector<std::uint8_t>& scratch,
                           std::uint64_t* out_seq)
{
    if (!ok_) return false;

    RecordHeader rh{};
    ifs_.read(reinterpret_cast<char*>(&rh), sizeof(rh));
    if (ifs_.gcount() == 0 && ifs_.eof()) return false;   // clean end of file
    if (!ifs_) throw SequenceIoError("FramePlayer: truncated record header");

    if (rh.format != static_cast<std::uint8_t>(PixelFormat::Gray8) ||
        static_cast<std::uint64_t>(rh.width) * rh.height != rh.data_size) {
        throw SequenceIoError("FramePlayer: unsupported record (format/size)");
    }

    scratch.resize(rh.data_size);
    if (rh.data_size) {
        ifs_.read(reinterpret_cast<char*>(scratch.data()), rh.data_size);
        if (!ifs_) throw SequenceIoError("FramePlayer: truncated frame data");
    }

    if (crc32Bytes(scratch.data(), scratch.size()) != rh.crc32) {
        throw SequenceIoError("FramePlayer: CRC mismatch in frame " + std::to_string(rh.seq));
    }

    if (out_seq) *out_seq = rh.seq;

    out.width  = rh.width;
    out.height = rh.height;
    out.format = PixelFormat::Gray8;
    out.data   = std::span<const std::uint8_t>(scratch.data(), scratch.size());

    return true;
}

} // namespace pathsweep
