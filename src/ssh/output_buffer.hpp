#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Append-only text received from a shell. Positions are byte lengths and
// only ever grow. Safe to read from one thread while another appends.
class OutputBuffer {
public:
    using Sink = std::function<void(const std::string&)>;

    // The only mutator. Each chunk is also forwarded to every sink.
    void append(const std::string& chunk);

    std::string snapshot() const;

    // Text appended after pos. A pos past the end yields "".
    std::string since(size_t pos) const;

    size_t size() const;

    // Register an observer for every appended chunk (e.g. verbose echo).
    void add_sink(Sink sink);

private:
    mutable std::mutex mutex_;
    std::string text_;
    std::vector<Sink> sinks_;
};
