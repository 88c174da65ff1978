#pragma once

#include "pathsweep/core/Frame.hpp"
#include "pathsweep/core/SequenceBuilder.hpp"

#include <string>
#include <utility>

namespace pathsweep {

/*
  Stored sequence collaborators.

  Container is chosen by extension:
    - ".sst" : native PSQ1 container (io/Recorder.hpp), lossless, CRC-checked;
    - other  : OpenCV multi-image codecs (cv::imreadmulti / cv::imwritemulti),
               e.g. GIF or multi-page TIFF, as the installed OpenCV supports.

  Frames are returned as CV_8UC1 (colour inputs are converted to gray).
  Failures raise SequenceIoError; frames of different sizes in one file raise
  ShapeMismatch.
*/
Sequence readSequence(const std::string& path);

void writeSequence(const std::string& path, const Sequence& seq);

/* Sink that writes the correlation sequence to a fixed path. */
class FileSequenceSink final : public ISequenceSink {
public:
    explicit FileSequenceSink(std::string path) : path_(std::move(path)) {}

    void write(const Sequence& seq) override;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace pathsweep
