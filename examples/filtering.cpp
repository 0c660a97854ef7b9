// filtering.cpp
//
// Demonstrates the logq filter model on an in-memory buffer.
//
// A record passes when every set filter matches:
//   level -> tag -> package (owning process, else raw line) -> text (message)
//
// Compile: g++ -std=c++11 -I include examples/filtering.cpp -o filtering -pthread

#include "logq.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

static void show(const char* title, const logq::RingBuffer& buffer, const logq::FilterState& filter) {
    logq::ThreadtimeFormatter formatter;
    std::cout << "== " << title << " (" << filter.describe() << ")\n";
    std::vector<logq::RecordPtr> shown = logq::Renderer::project(buffer.snapshot(), filter);
    for (size_t i = 0; i < shown.size(); ++i) {
        std::cout << "  " << formatter.format(*shown[i]) << "\n";
    }
}

int main() {
    logq::RingBuffer buffer;
    logq::ProcessTracker processes;
    const char* lines[] = {
        "--------- beginning of main",
        "03-14 15:09:26.535  1234  1250 I ActivityManager: Start proc 4321:com.example.app/u0a123",
        "03-14 15:09:26.601  4321  4321 D MyTag   : onCreate",
        "03-14 15:09:26.777  4321  4340 W OkHttp  : slow response: 1800ms",
        "03-14 15:09:27.002  4321  4321 E MyTag   : boom: NullPointerException",
        "03-14 15:09:27.010  4321  4321 F libc    : Fatal signal 6 (SIGABRT)",
    };
    for (size_t i = 0; i < sizeof(lines) / sizeof(lines[0]); ++i) {
        logq::LogRecord record = logq::LineParser::parse(lines[i]);
        processes.annotate(record);
        buffer.append(std::move(record));
    }

    logq::FilterState filter;
    show("everything", buffer, filter);

    // ---------------------------------------------------------------
    // 1. Level filters: "E" is exactly error, "W+" is warn and above,
    //    "VDI" is a set, '?' admits lines that did not parse.
    // ---------------------------------------------------------------
    filter.setLevel(logq::LevelFilter::parse("W+"));
    show("warnings and above", buffer, filter);

    filter.setLevel(logq::LevelFilter::parse("?"));
    show("unparsed only", buffer, filter);
    filter.clearLevel();

    // ---------------------------------------------------------------
    // 2. Substring vs exact. Quotes ask for equality.
    // ---------------------------------------------------------------
    filter.setTag("Tag");
    show("tag contains 'Tag'", buffer, filter);
    filter.setTag("\"MyTag\"");
    filter.setText("boom");
    show("tag is exactly MyTag, message mentions boom", buffer, filter);

    // ---------------------------------------------------------------
    // 3. The package filter follows the pids ActivityManager started for
    //    the package (and any line naming it). It can be toggled without
    //    forgetting the name.
    // ---------------------------------------------------------------
    filter.clearAllButPackage();
    filter.setPackageName("com.example.app");
    filter.setPackageEnabled(true);
    show("package", buffer, filter);

    filter.clearAll();
    show("after clearAll", buffer, filter);
    filter.togglePackage();
    show("package toggled back on", buffer, filter);

    // Invalid level specs are rejected, never half-applied.
    try {
        filter.setLevel(logq::LevelFilter::parse("WE+"));
    } catch (const std::invalid_argument& e) {
        std::cout << "rejected: " << e.what() << "\n";
    }
    return 0;
}
