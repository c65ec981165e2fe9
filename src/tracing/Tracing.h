#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace StemPrep {
namespace tracing {

// Open (append) a trace file; spans are recorded only while one is open.
// An empty path selects <temp dir>/stemprep-trace.log.
void InitTracing(const std::string& outfile);

// Flush and close the trace file. Safe to call when tracing was never started.
void ShutdownTracing();

bool IsTracingEnabled();

// Lightweight RAII init helper
struct ScopedTracing {
    explicit ScopedTracing(const std::string& outfile) { InitTracing(outfile); }
    ~ScopedTracing() { ShutdownTracing(); }
};

// Writes "START <name>" on construction and "END <name> duration=<ms>ms" when ended.
class Span {
public:
    explicit Span(const std::string& name);
    ~Span();

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    // End the span early; later calls and the destructor do nothing.
    void End();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tracing
} // namespace StemPrep

// Convenience macro to create a scoped span with a unique local name
#define STEMPREP_TRACE_CONCAT_INNER(a, b) a##b
#define STEMPREP_TRACE_CONCAT(a, b) STEMPREP_TRACE_CONCAT_INNER(a, b)
#define TRACE_SCOPE(name) ::StemPrep::tracing::Span STEMPREP_TRACE_CONCAT(trace_span_, __COUNTER__)(name)
