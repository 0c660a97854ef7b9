#include <benchmark/benchmark.h>
#include <cstdio>
#include <string>
#include <vector>
#include "logq.hpp"

namespace {

/// A full buffer with a realistic mix of tags and levels.
void fillBuffer(logq::RingBuffer& buffer) {
    const char levels[] = {'V', 'D', 'I', 'I', 'W', 'E'};
    const char* tags[] = {"ActivityManager", "chatty", "MyTag", "OkHttp", "SurfaceFlinger"};
    for (int i = 0; i < logq::RingBuffer::kDefaultCapacity; ++i) {
        char line[256];
        std::snprintf(line, sizeof(line),
                      "03-14 15:09:26.%03d  %4d  %4d %c %s: message %d %s",
                      i % 1000, 1000 + i % 7, 1000 + i % 13, levels[i % 6], tags[i % 5], i,
                      (i % 50 == 0) ? "com.example.app boom" : "ok");
        buffer.append(logq::LineParser::parse(line));
    }
}

void runProjection(benchmark::State& state, const logq::FilterState& filter) {
    logq::RingBuffer buffer;
    fillBuffer(buffer);
    logq::Snapshot snapshot = buffer.snapshot();
    for (auto _ : state) {
        std::vector<logq::RecordPtr> shown = logq::Renderer::project(snapshot, filter);
        benchmark::DoNotOptimize(shown.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(snapshot.size()));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BM_Project_NoFilter
// Baseline: everything passes.
// ---------------------------------------------------------------------------
static void BM_Project_NoFilter(benchmark::State& state) {
    runProjection(state, logq::FilterState());
}
BENCHMARK(BM_Project_NoFilter);

static void BM_Project_Level(benchmark::State& state) {
    logq::FilterState f;
    f.setLevel(logq::LevelFilter::parse("W+"));
    runProjection(state, f);
}
BENCHMARK(BM_Project_Level);

static void BM_Project_Tag(benchmark::State& state) {
    logq::FilterState f;
    f.setTag("MyTag");
    runProjection(state, f);
}
BENCHMARK(BM_Project_Tag);

// Package matches against the whole raw line, the most expensive subject.
static void BM_Project_Package(benchmark::State& state) {
    logq::FilterState f;
    f.setPackageName("com.example.app");
    f.setPackageEnabled(true);
    runProjection(state, f);
}
BENCHMARK(BM_Project_Package);

static void BM_Project_AllFilters(benchmark::State& state) {
    logq::FilterState f;
    f.setLevel(logq::LevelFilter::parse("I+"));
    f.setTag("MyTag");
    f.setPackageName("com.example.app");
    f.setPackageEnabled(true);
    f.setText("boom");
    runProjection(state, f);
}
BENCHMARK(BM_Project_AllFilters);
