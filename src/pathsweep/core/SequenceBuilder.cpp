#include "pathsweep/core/SequenceBuilder.hpp"
#include "pathsweep/align/CrossCorrelator.hpp"

#include <opencv2/core/utility.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace pathsweep {

Sequence buildCorrelationSequence(const Sequence& video,
                                  const Config& cfg,
                                  ISequenceSink* sink)
{
    if (video.size() < 2) {
        std::cerr << "[sequence] " << video.size()
                  << " frame(s): no adjacent pairs, result is empty\n";
        return {};
    }

    const int pairs = static_cast<int>(video.size()) - 1;
    Sequence slots(pairs);
    std::vector<std::exception_ptr> errors(pairs);

    auto body = [&](const cv::Range& range) {
        for (int i = range.start; i < range.end; ++i) {
            try {
                slots[i] = correlateAdjacentFrames(video[i], video[i+1], cfg);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    };

    if (cfg.workerThreads == 1 && cfg.pairFailure == PairFailurePolicy::FailFast) {
        // sequential fail-fast: the first failing pair propagates directly
        for (int i = 0; i < pairs; ++i) {
            slots[i] = correlateAdjacentFrames(video[i], video[i+1], cfg);
        }
    } else if (cfg.workerThreads == 1) {
        body(cv::Range(0, pairs));
    } else {
        const double stripes = cfg.workerThreads == 0 ? -1.0 : double(cfg.workerThreads);
        cv::parallel_for_(cv::Range(0, pairs), body, stripes);
    }

    Sequence out;
    out.reserve(pairs);
    for (int i = 0; i < pairs; ++i) {
        if (errors[i]) {
            if (cfg.pairFailure == PairFailurePolicy::FailFast) {
                std::rethrow_exception(errors[i]);
            }
            try {
                std::rethrow_exception(errors[i]);
            } catch (const std::exception& e) {
                std::cerr << "[sequence] skipping pair " << i << "->" << i+1
                          << ": " << e.what() << "\n";
            }
            continue;
        }
        out.push_back(std::move(slots[i]));
    }

    if (sink && !out.empty()) {
        sink->write(out);
    }
    return out;
}

} // namespace pathsweep
