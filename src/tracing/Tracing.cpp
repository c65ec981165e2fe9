#include "tracing/Tracing.h"
#include "utils/Logger.h"

#include <filesystem>
#include <fstream>
#include <mutex>

namespace StemPrep {
namespace tracing {

struct Span::Impl {
    std::string name;
    std::chrono::steady_clock::time_point start;
    bool ended = false;
};

static std::mutex g_mutex;
static std::unique_ptr<std::ofstream> g_out;
static std::string g_outfile_path;

void InitTracing(const std::string& outfile) {
    std::lock_guard<std::mutex> lk(g_mutex);
    std::filesystem::path new_path;
    if (!outfile.empty()) new_path = outfile;
    else {
        std::error_code ec;
        std::filesystem::path td = std::filesystem::temp_directory_path(ec);
        if (!ec) {
            new_path = td / "stemprep-trace.log";
        } else {
            logWarn("Unable to determine temp directory: " + ec.message() + ". Using current directory for trace file.");
            new_path = std::filesystem::path("stemprep-trace.log");
        }
    }

    if (g_out) {
        if (g_outfile_path == new_path.string()) {
            // Already initialized to this file, do nothing
            return;
        }
        g_out->flush();
        g_out->close();
        g_out.reset();
        g_outfile_path.clear();
    }

    g_out = std::make_unique<std::ofstream>(new_path.string(), std::ios::app);
    if (!g_out->is_open()) {
        logWarn("Could not open tracing file: " + new_path.string());
        g_out.reset();
        g_outfile_path.clear();
    } else {
        g_outfile_path = new_path.string();
    }
}

void ShutdownTracing() {
    std::lock_guard<std::mutex> lk(g_mutex);
    if (g_out) {
        g_out->flush();
        g_out->close();
        g_out.reset();
    }
    // Also clear the cached outfile path so re-initialization behaves correctly
    g_outfile_path.clear();
}

bool IsTracingEnabled() {
    std::lock_guard<std::mutex> lk(g_mutex);
    return g_out != nullptr;
}

Span::Span(const std::string& name) : impl_(std::make_unique<Impl>()) {
    impl_->name = name;
    impl_->start = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(g_mutex);
    if (g_out) {
        (*g_out) << currentTimestamp() << " START " << impl_->name << "\n";
    }
}

Span::~Span() {
    End();
}

void Span::End() {
    if (!impl_ || impl_->ended) return;
    impl_->ended = true;
    auto end = std::chrono::steady_clock::now();
    auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(end - impl_->start).count();
    std::lock_guard<std::mutex> lk(g_mutex);
    if (g_out) {
        (*g_out) << currentTimestamp() << " END   " << impl_->name << " duration=" << dur << "ms\n";
    }
}

} // namespace tracing
} // namespace StemPrep
