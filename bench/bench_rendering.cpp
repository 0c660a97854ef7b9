#include <benchmark/benchmark.h>
#include <string>
#include "logq.hpp"
#include "null_transport.hpp"

namespace {

const char* kLine =
    "03-14 15:09:26.535  1234  1250 W ActivityManager: Slow operation: 112ms so far, now at startProcess";

} // anonymous namespace

// ---------------------------------------------------------------------------
// BM_Redraw_FullScreen
// Full repaint of a 50x200 screen from a full buffer.
// ---------------------------------------------------------------------------
static void BM_Redraw_FullScreen(benchmark::State& state) {
    logq::NullTransport out;
    logq::Renderer renderer(out, state.range(0) != 0, 50, 200);
    logq::RingBuffer buffer;
    logq::LogRecord record = logq::LineParser::parse(kLine);
    for (int i = 0; i < logq::RingBuffer::kDefaultCapacity; ++i) buffer.append(record);
    logq::Snapshot snapshot = buffer.snapshot();
    logq::FilterState filter;

    for (auto _ : state) {
        renderer.redraw(snapshot, filter, false);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Redraw_FullScreen)->Arg(0)->Arg(1);

// ---------------------------------------------------------------------------
// BM_DrawNew_Single
// One new line per wakeup, the steady-state follow case.
// ---------------------------------------------------------------------------
static void BM_DrawNew_Single(benchmark::State& state) {
    logq::NullTransport out;
    logq::Renderer renderer(out, true, 50, 200);
    logq::RingBuffer buffer;
    logq::LogRecord record = logq::LineParser::parse(kLine);
    logq::FilterState filter;

    for (auto _ : state) {
        buffer.append(record);
        benchmark::DoNotOptimize(renderer.drawNew(buffer, filter));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DrawNew_Single);

static void BM_FormatThreadtime(benchmark::State& state) {
    logq::ThreadtimeFormatter formatter;
    logq::LogRecord record = logq::LineParser::parse(kLine);
    for (auto _ : state) {
        std::string s = formatter.format(record);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FormatThreadtime);
