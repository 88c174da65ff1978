/**
 * test_correlator.cpp - cross-correlation of adjacent frames
 */
#include "pathsweep/align/CrossCorrelator.hpp"
#include "pathsweep/core/Errors.hpp"
#include "test_common.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace pathsweep;

int main()
{
    std::cout << "CrossCorrelator Tests" << std::endl;

    const cv::Mat master = testutil::texture(320, 320, 7);
    const cv::Mat F = testutil::crop(master, 60, 60);

    // Test 1: 160x160 frames give a 50x50 8-bit frame spanning 0..255
    {
        const cv::Mat G = testutil::crop(master, 70, 66);
        cv::Mat q = correlateAdjacentFrames(F, G);
        assert(q.rows == 50 && q.cols == 50);
        assert(q.type() == CV_8UC1);
        double mn, mx; cv::minMaxLoc(q, &mn, &mx);
        assert(mn == 0.0 && mx == 255.0);
        std::cout << "[PASS] 50x50 quantized output with full contrast" << std::endl;
    }

    // Test 2: a frame against itself peaks at the center offset
    {
        CorrelationResult r = correlateFrames(F, F);
        assert(!r.degenerate);
        assert(r.bestOffset == cv::Point(25, 25));
        assert(r.quantized.at<std::uint8_t>(25, 25) == 255);
        std::cout << "[PASS] self-correlation peaks at (25,25)" << std::endl;
    }

    // Test 3: camera moved by (+8, +4) -> peak at (25+4 rows, 25+8 cols)
    {
        const cv::Mat prev = testutil::crop(master, 60, 60);
        const cv::Mat curr = testutil::crop(master, 68, 64);
        CorrelationResult r = correlateFrames(prev, curr);
        assert(r.bestOffset.x == 33 && r.bestOffset.y == 29);
        std::cout << "[PASS] translation shows up as peak offset" << std::endl;
    }

    // Test 4: shared offset is the midpoint of the two frame means
    {
        // a brighter 'curr' must not change the location of the peak
        const cv::Mat prev = testutil::crop(master, 60, 60);
        cv::Mat curr = testutil::crop(master, 52, 60);
        cv::Mat brighter; curr.convertTo(brighter, CV_8U, 0.8, 40.0);
        CorrelationResult r = correlateFrames(prev, brighter);
        assert(r.bestOffset.x == 17 && r.bestOffset.y == 25);

        // the surface equals the brute-force definition
        cv::Mat A, B;
        prev.convertTo(A, CV_64F, 1.0/255.0);
        brighter.convertTo(B, CV_64F, 1.0/255.0);
        const double off = 0.5 * (cv::mean(A)[0] + cv::mean(B)[0]);
        A -= off; B -= off;
        cv::Mat T = B(cv::Rect(25, 25, 110, 110));
        for (int rr : {0, 13, 49}) {
            for (int cc : {0, 31, 49}) {
                double s = 0.0;
                for (int y = 0; y < 110; ++y)
                    for (int x = 0; x < 110; ++x)
                        s += T.at<double>(y, x) * A.at<double>(rr + y, cc + x);
                assert(std::abs(s - r.surface.at<double>(rr, cc)) < 1e-9 * (1.0 + std::abs(s)));
            }
        }
        std::cout << "[PASS] surface matches brute-force windowed products" << std::endl;
    }

    // Test 5: matchTemplate path agrees with the direct path
    {
        const cv::Mat G = testutil::crop(master, 48, 72);
        Config fast; fast.method = CorrelationMethod::Fast;
        CorrelationResult d = correlateFrames(F, G);
        CorrelationResult f = correlateFrames(F, G, fast);
        assert(d.surface.size() == f.surface.size());
        const double range = d.maxScore - d.minScore;
        assert(cv::norm(d.surface, f.surface, cv::NORM_INF) < 1e-3 * range);
        assert(d.bestOffset == f.bestOffset);
        std::cout << "[PASS] fast method matches direct within tolerance" << std::endl;
    }

    // Test 6: quantization truncates
    {
        cv::Mat s = (cv::Mat_<double>(1, 4) << 0.0, 1.5, 1.999, 3.0);
        cv::Mat q = quantizeSurface(s);
        assert(q.at<std::uint8_t>(0, 0) == 0);
        assert(q.at<std::uint8_t>(0, 1) == 127);   // 127.5 -> 127
        assert(q.at<std::uint8_t>(0, 2) == 169);   // 169.915 -> 169
        assert(q.at<std::uint8_t>(0, 3) == 255);
        std::cout << "[PASS] quantization truncates toward zero" << std::endl;

        // the maximum lands on 255 for ranges where range*255/range < 255
        for (double mx : {1.1, 0.7, 3.3, 12.9, 1e-6 * 1.1, 987.1}) {
            cv::Mat two = (cv::Mat_<double>(1, 2) << 0.0, mx);
            cv::Mat q2 = quantizeSurface(two);
            assert(q2.at<std::uint8_t>(0, 0) == 0);
            assert(q2.at<std::uint8_t>(0, 1) == 255);
        }
        cv::Mat shifted = (cv::Mat_<double>(2, 2) << -4.2, 0.3, 7.7, -1.9);
        double mn, mxq; cv::minMaxLoc(quantizeSurface(shifted), &mn, &mxq);
        assert(mn == 0.0 && mxq == 255.0);
        std::cout << "[PASS] surface maximum always maps to 255" << std::endl;
    }

    // Test 7: shape errors are reported
    {
        bool thrown = false;
        try { correlateFrames(F, cv::Mat(150, 160, CV_8UC1, cv::Scalar(0))); }
        catch (const ShapeMismatch&) { thrown = true; }
        assert(thrown);

        thrown = false;
        try { correlateFrames(F, cv::Mat(160, 160, CV_8UC3, cv::Scalar(0,0,0))); }
        catch (const ShapeMismatch&) { thrown = true; }
        assert(thrown);

        thrown = false;
        try { correlateFrames(cv::Mat(40, 40, CV_8UC1), cv::Mat(40, 40, CV_8UC1)); }
        catch (const ShapeMismatch&) { thrown = true; }
        assert(thrown);
        std::cout << "[PASS] mismatched frames raise ShapeMismatch" << std::endl;
    }

    // Test 8: constant frames follow the degenerate policy
    {
        const cv::Mat flat(160, 160, CV_8UC1, cv::Scalar(90));

        CorrelationResult z = correlateFrames(flat, flat);
        assert(z.degenerate);
        assert(cv::countNonZero(z.quantized) == 0);

        Config mid; mid.degenerate = DegeneratePolicy::MidGray;
        cv::Mat m = correlateAdjacentFrames(flat, flat, mid);
        double mn, mx; cv::minMaxLoc(m, &mn, &mx);
        assert(mn == 128.0 && mx == 128.0);

        Config strict; strict.degenerate = DegeneratePolicy::Throw;
        bool thrown = false;
        try { correlateAdjacentFrames(flat, flat, strict); }
        catch (const DegenerateSurface&) { thrown = true; }
        assert(thrown);
        std::cout << "[PASS] degenerate surfaces follow policy" << std::endl;
    }

    // Test 9: other frame sizes follow the margin
    {
        const cv::Mat a = master(cv::Rect(10, 10, 120, 100)).clone();
        const cv::Mat b = master(cv::Rect(14, 12, 120, 100)).clone();
        Config c; c.templateMargin = 10;
        cv::Mat q = correlateAdjacentFrames(a, b, c);
        assert(q.rows == 20 && q.cols == 20);
        std::cout << "[PASS] output size is 2*margin per axis" << std::endl;
    }

    std::cout << std::endl << "All tests passed!" << std::endl;
    return 0;
}
