/**
 * test_sequence.cpp - correlation sequence builder
 */
#include "pathsweep/align/CrossCorrelator.hpp"
#include "pathsweep/core/Errors.hpp"
#include "pathsweep/core/SequenceBuilder.hpp"
#include "test_common.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

using namespace pathsweep;

namespace {

/* Sink that remembers what it was given. */
class CountingSink final : public ISequenceSink {
public:
    void write(const Sequence& seq) override { ++calls; last = seq; }
    int calls{0};
    Sequence last;
};

Sequence panRight(const cv::Mat& master, int n, int step) {
    Sequence v;
    for (int i = 0; i < n; ++i) v.push_back(testutil::crop(master, 40 + i*step, 60));
    return v;
}

} // namespace

int main()
{
    std::cout << "SequenceBuilder Tests" << std::endl;

    const cv::Mat master = testutil::texture(360, 300, 11);

    // Test 1: N frames -> N-1 correlation frames, in pair order
    {
        const Sequence video = panRight(master, 6, 8);
        const Sequence corr = buildCorrelationSequence(video);
        assert(corr.size() == 5);
        for (std::size_t i = 0; i < corr.size(); ++i) {
            assert(testutil::identical(corr[i], correlateAdjacentFrames(video[i], video[i+1])));
        }
        std::cout << "[PASS] N-1 outputs in input order" << std::endl;
    }

    // Test 2: sink receives the full result; result is returned either way
    {
        const Sequence video = panRight(master, 4, 4);
        CountingSink sink;
        const Sequence withSink = buildCorrelationSequence(video, {}, &sink);
        const Sequence without  = buildCorrelationSequence(video);
        assert(sink.calls == 1);
        assert(sink.last.size() == 3 && withSink.size() == 3 && without.size() == 3);
        for (std::size_t i = 0; i < 3; ++i) {
            assert(testutil::identical(sink.last[i], withSink[i]));
            assert(testutil::identical(withSink[i], without[i]));
        }
        std::cout << "[PASS] write-through sink gets the same sequence" << std::endl;
    }

    // Test 3: fewer than two frames -> empty, sink untouched
    {
        CountingSink sink;
        assert(buildCorrelationSequence({}, {}, &sink).empty());
        assert(buildCorrelationSequence({testutil::crop(master, 0, 0)}, {}, &sink).empty());
        assert(sink.calls == 0);
        std::cout << "[PASS] fewer than two frames gives empty output" << std::endl;
    }

    // Test 4: parallel evaluation keeps order and values
    {
        const Sequence video = panRight(master, 9, 4);
        Config par; par.workerThreads = 0;
        const Sequence a = buildCorrelationSequence(video);
        const Sequence b = buildCorrelationSequence(video, par);
        assert(a.size() == b.size());
        for (std::size_t i = 0; i < a.size(); ++i) assert(testutil::identical(a[i], b[i]));
        std::cout << "[PASS] parallel build equals sequential build" << std::endl;
    }

    // Test 5: a bad frame aborts (FailFast) or drops its two pairs (SkipPair)
    {
        Sequence video = panRight(master, 5, 8);
        video[2] = master(cv::Rect(0, 0, 150, 160)).clone();

        bool thrown = false;
        try { buildCorrelationSequence(video); }
        catch (const ShapeMismatch&) { thrown = true; }
        assert(thrown);

        Config skip; skip.pairFailure = PairFailurePolicy::SkipPair;
        const Sequence corr = buildCorrelationSequence(video, skip);
        assert(corr.size() == 2);
        assert(testutil::identical(corr[0], correlateAdjacentFrames(video[0], video[1])));
        assert(testutil::identical(corr[1], correlateAdjacentFrames(video[3], video[4])));
        std::cout << "[PASS] pair failure policy" << std::endl;
    }

    // Test 6: sequential fail-fast stops at the first failing pair
    {
        const cv::Mat flat(160, 160, CV_8UC1, cv::Scalar(50));
        Sequence video = { testutil::crop(master, 40, 60),
                           master(cv::Rect(0, 0, 150, 160)).clone(),
                           flat, flat, flat };

        // later (flat) pairs would each log a degenerate-surface warning
        std::ostringstream captured;
        std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());
        bool thrown = false;
        try { buildCorrelationSequence(video); }
        catch (const ShapeMismatch&) { thrown = true; }
        std::cerr.rdbuf(old);

        assert(thrown);
        assert(captured.str().find("degenerate") == std::string::npos);

        // with SkipPair the flat pairs are evaluated
        captured.str("");
        old = std::cerr.rdbuf(captured.rdbuf());
        Config skip; skip.pairFailure = PairFailurePolicy::SkipPair;
        const Sequence corr = buildCorrelationSequence(video, skip);
        std::cerr.rdbuf(old);
        assert(corr.size() == 2);
        assert(captured.str().find("degenerate") != std::string::npos);
        std::cout << "[PASS] sequential fail-fast stops early" << std::endl;
    }

    std::cout << std::endl << "All tests passed!" << std::endl;
    return 0;
}
