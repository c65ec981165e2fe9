#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "pipeline/Segmenter.h"

#include <limits>
#include <stdexcept>

using namespace StemPrep;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Segment sample count follows the sample rate", "[segmenter]") {
    REQUIRE(segmentSampleCount(5.0, 22050) == 110250);
    REQUIRE(segmentSampleCount(3.0, 22050) == 66150);
    REQUIRE(segmentSampleCount(0.5, 44100) == 22050);
}

TEST_CASE("Segment sample count rejects empty windows", "[segmenter][edge]") {
    REQUIRE_THROWS_AS(segmentSampleCount(0.0, 22050), std::invalid_argument);
    REQUIRE_THROWS_AS(segmentSampleCount(-1.0, 22050), std::invalid_argument);
    REQUIRE_THROWS_AS(segmentSampleCount(5.0, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(segmentSampleCount(1e-6, 22050), std::invalid_argument);
}

TEST_CASE("Segment sample count rejects windows too long to count", "[segmenter][edge]") {
    REQUIRE_THROWS_WITH(segmentSampleCount(1e300, 22050), ContainsSubstring("too long"));
    REQUIRE_THROWS_WITH(segmentSampleCount(std::numeric_limits<double>::infinity(), 22050),
                        ContainsSubstring("too long"));
    // One day at 192 kHz is still representable
    REQUIRE(segmentSampleCount(86400.0, 192000) == 16588800000ULL);
}

TEST_CASE("Segment count is the ceiling of length over window", "[segmenter]") {
    REQUIRE(segmentCount(0, 100) == 0);
    REQUIRE(segmentCount(1, 100) == 1);
    REQUIRE(segmentCount(100, 100) == 1);
    REQUIRE(segmentCount(101, 100) == 2);
    REQUIRE(segmentCount(220500, 110250) == 2);
    REQUIRE(segmentCount(220501, 110250) == 3);
    REQUIRE_THROWS_AS(segmentCount(10, 0), std::invalid_argument);
}

TEST_CASE("Segments tile the stem without gaps or overlaps", "[segmenter]") {
    const size_t window = 110250;
    for (size_t length : {size_t(1), size_t(50000), size_t(110250), size_t(110251), size_t(551250), size_t(600001)}) {
        auto segments = computeSegments(length, window);
        REQUIRE(segments.size() == segmentCount(length, window));

        size_t expectedBegin = 0;
        for (size_t j = 0; j < segments.size(); ++j) {
            REQUIRE(segments[j].index == j);
            REQUIRE(segments[j].begin == expectedBegin);
            REQUIRE(segments[j].end > segments[j].begin);
            REQUIRE(segments[j].length() <= window);
            expectedBegin = segments[j].end;
        }
        REQUIRE(expectedBegin == length);
    }
}

TEST_CASE("Last segment is truncated, not padded", "[segmenter][edge]") {
    auto segments = computeSegments(250000, 110250);
    REQUIRE(segments.size() == 3);
    REQUIRE(segments[0].length() == 110250);
    REQUIRE(segments[1].length() == 110250);
    REQUIRE(segments[2].begin == 220500);
    REQUIRE(segments[2].end == 250000);
}

TEST_CASE("Stem shorter than one window yields a single segment", "[segmenter][edge]") {
    auto segments = computeSegments(50000, 110250);
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].begin == 0);
    REQUIRE(segments[0].end == 50000);
}

TEST_CASE("Empty stem yields no segments", "[segmenter][edge]") {
    REQUIRE(computeSegments(0, 110250).empty());
}

TEST_CASE("Effective length honours the duration limit", "[segmenter]") {
    const int sr = 22050;

    SECTION("No limit processes the full stem") {
        REQUIRE(effectiveLength(220500, std::nullopt, sr) == 220500);
    }

    SECTION("2.5 s limit on a 10 s stem") {
        size_t length = effectiveLength(220500, 2.5, sr);
        REQUIRE(length == 55125);
        auto segments = computeSegments(length, segmentSampleCount(5.0, sr));
        REQUIRE(segments.size() == 1);
        REQUIRE(segments[0].begin == 0);
        REQUIRE(segments[0].end == 55125);
    }

    SECTION("Limit longer than the stem is clamped") {
        REQUIRE(effectiveLength(50000, 30.0, sr) == 50000);
    }

    SECTION("Zero limit processes nothing") {
        REQUIRE(effectiveLength(50000, 0.0, sr) == 0);
    }

    SECTION("Negative limit is rejected") {
        REQUIRE_THROWS_AS(effectiveLength(50000, -1.0, sr), std::invalid_argument);
    }
}
