#include <catch2/catch_test_macros.hpp>
#include "tracing/Tracing.h"
#include "test_helpers.h"

using namespace StemPrep;

namespace {

std::string readText(const std::filesystem::path& path) {
    auto bytes = testing::readBytes(path);
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST_CASE("Tracing writes start and end records to file", "[tracing]") {
    testing::TempDir dir("stemprep_trace");
    const auto tracePath = dir.path() / "trace.log";

    tracing::InitTracing(tracePath.string());
    REQUIRE(tracing::IsTracingEnabled());
    {
        TRACE_SCOPE("walk data/raw");
        TRACE_SCOPE("track song.stem.mp4");
    }
    tracing::ShutdownTracing();
    REQUIRE_FALSE(tracing::IsTracingEnabled());

    const std::string content = readText(tracePath);
    REQUIRE(content.find("START walk data/raw") != std::string::npos);
    REQUIRE(content.find("END   walk data/raw duration=") != std::string::npos);
    REQUIRE(content.find("START track song.stem.mp4") != std::string::npos);
    // Inner span closes before the outer one
    REQUIRE(content.find("END   track song.stem.mp4") < content.find("END   walk data/raw"));
}

TEST_CASE("Span End is idempotent", "[tracing]") {
    testing::TempDir dir("stemprep_trace");
    const auto tracePath = dir.path() / "trace.log";

    {
        tracing::ScopedTracing scoped(tracePath.string());
        tracing::Span span("decode");
        span.End();
        span.End();
    }

    const std::string content = readText(tracePath);
    const auto first = content.find("END   decode");
    REQUIRE(first != std::string::npos);
    REQUIRE(content.find("END   decode", first + 1) == std::string::npos);
}

TEST_CASE("Spans are silent without tracing", "[tracing]") {
    tracing::ShutdownTracing();
    REQUIRE_FALSE(tracing::IsTracingEnabled());
    REQUIRE_NOTHROW([] { TRACE_SCOPE("untraced"); }());
}
