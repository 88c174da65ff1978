#pragma once

#include "pathsweep/core/Config.hpp"
#include "pathsweep/core/Frame.hpp"

namespace pathsweep {

/*
  Persistence interface for a finished correlation sequence.
  Implementations:
    - FileSequenceSink (io/SequenceIO.hpp): writes to a file on disk.
*/
class ISequenceSink {
public:
    virtual ~ISequenceSink() = default;

    virtual void write(const Sequence& seq) = 0;
};

/*
  Correlate every adjacent pair of 'video' (frame i with frame i+1).

  - Output has video.size()-1 frames in input order (empty for < 2 frames).
  - If 'sink' is given and the output is non-empty, the whole output is
    handed to it before returning.
  - Pair failures follow cfg.pairFailure; cfg.workerThreads != 1 computes
    pairs with cv::parallel_for_.
*/
Sequence buildCorrelationSequence(const Sequence& video,
                                  const Config& cfg = {},
                                  ISequenceSink* sink = nullptr);

} // namespace pathsweep
