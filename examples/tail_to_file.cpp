// tail_to_file.cpp
//
// Follows a log file without a terminal: a background Tailer fills the
// ring buffer, the notifier reports visible arrivals, and the viewer's
// own diagnostics go to a threadtime file that logq can open as well.
//
// Usage: tail_to_file LOGFILE [SECONDS]
//
// Compile: g++ -std=c++11 -I include examples/tail_to_file.cpp -o tail_to_file -pthread

#include "logq.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " LOGFILE [SECONDS]\n";
        return 2;
    }
    int seconds = argc > 2 ? std::atoi(argv[2]) : 5;

    logq::DiagnosticLog diag(logq::Level::Debug);
    diag.addSink<logq::FileSink>("tail_to_file.diag.log");

    logq::RingBuffer buffer;
    logq::FilterState initial;
    initial.setLevel(logq::LevelFilter::parse("W+"));
    logq::LiveFilter filter(initial);
    logq::ViewState view;

    logq::TailOptions options;
    options.path = argv[1];
    options.seedExisting = false;

    logq::Tailer tailer(options, buffer, filter, view, &diag);
    std::atomic<int> wakeups(0);
    tailer.setNotifier([&wakeups]() { ++wakeups; });

    try {
        tailer.open();
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    tailer.start();

    logq::ThreadtimeFormatter formatter;
    std::uint64_t shownUpTo = 0;
    for (int tick = 0; tick < seconds * 10; ++tick) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        logq::Snapshot fresh = buffer.snapshotAfter(shownUpTo);
        logq::FilterState current = filter.get();
        for (size_t i = 0; i < fresh.size(); ++i) {
            if (current.matches(fresh[i])) std::cout << formatter.format(fresh[i]) << "\n";
            shownUpTo = fresh[i].sequence;
        }
        if (tailer.state() == logq::TailState::Error) {
            std::cout << "tailer stopped: " << tailer.status().message << "\n";
            break;
        }
    }

    tailer.stop();
    std::cout << tailer.linesRead() << " lines read, " << wakeups.load() << " wakeups, "
              << tailer.status().rotations << " rotations\n";
    return 0;
}
