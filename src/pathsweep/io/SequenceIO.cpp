#include "pathsweep/io/SequenceIO.hpp"
#include "pathsweep/io/Recorder.hpp"
#include "pathsweep/core/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace pathsweep {

// ---------------- helpers ----------------

static std::string ext_of(const std::filesystem::path& p) {
    std::string e = p.extension().string();
    if (!e.empty() && e[0]=='.') e.erase(0,1);
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c){ return std::tolower(c); });
    return e;
}

// Any decoded page -> CV_8UC1
static cv::Mat toGray8(const cv::Mat& src) {
    cv::Mat gray;
    if (src.channels() == 1) {
        gray = src;
    } else {
        int code = (src.channels()==4) ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY;
        cv::cvtColor(src, gray, code);
    }
    if (gray.depth() == CV_8U) return gray.clone();

    cv::Mat u8;
    switch (gray.depth()) {
        case CV_16U: gray.convertTo(u8, CV_8U, 255.0/65535.0); break;
        case CV_32F:
        case CV_64F: gray.convertTo(u8, CV_8U, 255.0);         break;
        default:     gray.convertTo(u8, CV_8U);                break;
    }
    return u8;
}

static void checkSameSize(const Sequence& seq, const std::string& path) {
    for (std::size_t i = 1; i < seq.size(); ++i) {
        if (seq[i].size() != seq[0].size()) {
            throw ShapeMismatch("sequence '" + path + "': frame " + std::to_string(i) +
                                " differs in size from frame 0");
        }
    }
}

// ---------------- PSQ1 ----------------

static Sequence readNative(const std::string& path) {
    FramePlayer player(path);
    if (!player.ok()) throw SequenceIoError("cannot open '" + path + "' as PSQ1");

    Sequence out;
    Frame f;
    std::vector<std::uint8_t> scratch;
    std::uint64_t seq = 0;
    while (player.readNext(f, scratch, &seq)) {
        if (seq != out.size()) {
            throw SequenceIoError("'" + path + "': record " + std::to_string(out.size()) +
                                  " carries sequence number " + std::to_string(seq));
        }
        out.push_back(toGray8View(f).clone());
    }
    return out;
}

static void writeNative(const std::string& path, const Sequence& seq) {
    FrameRecorder rec(path);
    if (!rec.ok()) throw SequenceIoError("cannot create '" + path + "'");

    std::uint64_t n = 0;
    for (const cv::Mat& m : seq) {
        cv::Mat c = m.isContinuous() ? m : m.clone();
        if (!rec.write(fromGray8(c), n++)) {
            throw SequenceIoError("write failed for '" + path + "' at frame " + std::to_string(n-1));
        }
    }
}

// ---------------- public ----------------

Sequence readSequence(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw SequenceIoError("no such file: '" + path + "'");
    }

    Sequence out;
    if (ext_of(path) == "sst") {
        out = readNative(path);
    } else {
        std::vector<cv::Mat> pages;
        if (!cv::imreadmulti(path, pages, cv::IMREAD_UNCHANGED) || pages.empty()) {
            throw SequenceIoError("cannot decode '" + path + "'");
        }
        out.reserve(pages.size());
        for (const cv::Mat& p : pages) out.push_back(toGray8(p));
    }

    checkSameSize(out, path);
    std::cout << "[io] read " << out.size() << " frame(s) from " << path;
    if (!out.empty()) std::cout << " (" << out[0].cols << "x" << out[0].rows << ")";
    std::cout << "\n";
    return out;
}

void writeSequence(const std::string& path, const Sequence& seq) {
    for (const cv::Mat& m : seq) {
        if (m.type() != CV_8UC1) throw ShapeMismatch("writeSequence: frames must be CV_8UC1");
    }
    checkSameSize(seq, path);

    const std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

    if (ext_of(path) == "sst") {
        writeNative(path, seq);
    } else {
        bool ok = false;
        try {
            ok = cv::imwritemulti(path, seq);
        } catch (const cv::Exception& e) {
            throw SequenceIoError("cannot encode '" + path + "': " + e.what());
        }
        if (!ok) throw SequenceIoError("cannot encode '" + path + "'");
    }
    std::cout << "[io] wrote " << seq.size() << " frame(s) to " << path << "\n";
}

void FileSequenceSink::write(const Sequence& seq) {
    writeSequence(path_, seq);
}

} // namespace pathsweep
