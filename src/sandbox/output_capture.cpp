/**
 * @file output_capture.cpp
 * @brief OutputCapture implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/output_capture.hpp"

#include <algorithm>

namespace sandbox_runner {

OutputCapture::OutputCapture(size_t max_bytes_per_stream)
    : max_bytes_(max_bytes_per_stream) {}

void OutputCapture::append(Stream stream, std::string_view data) {
    if (data.empty()) return;

    std::lock_guard lock(mutex_);
    auto& buffer = stream == Stream::Stdout ? stdout_ : stderr_;

    size_t room = max_bytes_ > buffer.size() ? max_bytes_ - buffer.size() : 0;
    size_t take = std::min(room, data.size());
    buffer.append(data.data(), take);
    if (take < data.size()) {
        truncated_ = true;
    }
}

CapturedOutput OutputCapture::snapshot() const {
    std::lock_guard lock(mutex_);
    return CapturedOutput{stdout_, stderr_, truncated_};
}

bool OutputCapture::truncated() const {
    std::lock_guard lock(mutex_);
    return truncated_;
}

size_t OutputCapture::size(Stream stream) const {
    std::lock_guard lock(mutex_);
    return stream == Stream::Stdout ? stdout_.size() : stderr_.size();
}

}  // namespace sandbox_runner
