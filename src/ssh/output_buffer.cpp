#include "output_buffer.hpp"

void OutputBuffer::append(const std::string& chunk) {
    if (chunk.empty()) return;

    std::vector<Sink> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        text_ += chunk;
        sinks = sinks_;
    }
    // Sinks run outside the lock so they may read the buffer back
    for (const auto& sink : sinks) {
        sink(chunk);
    }
}

std::string OutputBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_;
}

std::string OutputBuffer::since(size_t pos) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pos >= text_.size()) return "";
    return text_.substr(pos);
}

size_t OutputBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_.size();
}

void OutputBuffer::add_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}
