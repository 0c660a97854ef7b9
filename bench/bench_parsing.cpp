#include <benchmark/benchmark.h>
#include <string>
#include <vector>
#include "logq.hpp"

namespace {

const char* kThreadtime =
    "03-14 15:09:26.535  1234  1250 D ActivityManager: Start proc 4321:com.example.app/u0a123";
const char* kPaddedTag =
    "03-14 15:09:26.535  1234  1250 I chatty  : uid=1000(system) Binder:1234_5 expire 3 lines";
const char* kUnparsed = "--------- beginning of main";

std::string chunkOfLines(size_t lines) {
    std::string out;
    for (size_t i = 0; i < lines; ++i) {
        out += kThreadtime;
        out += '\n';
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BM_Parse_Threadtime
// Well-formed line, the common case.
// ---------------------------------------------------------------------------
static void BM_Parse_Threadtime(benchmark::State& state) {
    std::string line = kThreadtime;
    for (auto _ : state) {
        logq::LogRecord r = logq::LineParser::parse(line);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Parse_Threadtime);

static void BM_Parse_PaddedTag(benchmark::State& state) {
    std::string line = kPaddedTag;
    for (auto _ : state) {
        logq::LogRecord r = logq::LineParser::parse(line);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Parse_PaddedTag);

// Rejected lines must not cost more than accepted ones.
static void BM_Parse_Unparsed(benchmark::State& state) {
    std::string line = kUnparsed;
    for (auto _ : state) {
        logq::LogRecord r = logq::LineParser::parse(line);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Parse_Unparsed);

// ---------------------------------------------------------------------------
// BM_Split_Chunk
// Splitter over a read-sized chunk of lines.
// ---------------------------------------------------------------------------
static void BM_Split_Chunk(benchmark::State& state) {
    std::string chunk = chunkOfLines(static_cast<size_t>(state.range(0)));
    std::vector<std::string> lines;
    for (auto _ : state) {
        logq::LineSplitter splitter;
        lines.clear();
        splitter.feed(chunk.data(), chunk.size(), lines);
        benchmark::DoNotOptimize(lines.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(chunk.size()));
}
BENCHMARK(BM_Split_Chunk)->Arg(64)->Arg(1024);

// ---------------------------------------------------------------------------
// BM_Append_Full
// Appends into a full buffer, so every append evicts.
// ---------------------------------------------------------------------------
static void BM_Append_Full(benchmark::State& state) {
    logq::RingBuffer buffer;
    logq::LogRecord record = logq::LineParser::parse(kThreadtime);
    for (int i = 0; i < logq::RingBuffer::kDefaultCapacity; ++i) buffer.append(record);
    for (auto _ : state) {
        buffer.append(record);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Append_Full);
