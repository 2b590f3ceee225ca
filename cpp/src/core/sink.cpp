// ==============================================================================
// sink.cpp - Выходной буфер форматтера с откатом
// ==============================================================================

#include "wsformat/sink.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace wsformat {

namespace {

[[noreturn]] void throw_bad_rewind(std::size_t target, std::size_t position) {
    throw std::out_of_range("cannot rewind to position " + std::to_string(target) +
                            " past the current position " + std::to_string(position));
}

}  // namespace

// ----------------------------------------------------------------------------
// BufferSink
// ----------------------------------------------------------------------------

BufferSink::BufferSink(std::size_t capacity) {
    data_.reserve(capacity);
}

void BufferSink::write(char byte) {
    data_.push_back(byte);
}

void BufferSink::write(std::string_view bytes) {
    data_.append(bytes.data(), bytes.size());
}

void BufferSink::rewind(std::size_t previous_position) {
    if (previous_position > data_.size()) {
        throw_bad_rewind(previous_position, data_.size());
    }
    data_.resize(previous_position);
}

std::string BufferSink::release() {
    std::string result = std::move(data_);
    data_.clear();
    return result;
}

// ----------------------------------------------------------------------------
// CountingSink
// ----------------------------------------------------------------------------

void CountingSink::write(char /*byte*/) {
    ++position_;
    maximum_position_ = std::max(maximum_position_, position_);
}

void CountingSink::write(std::string_view bytes) {
    position_ += bytes.size();
    maximum_position_ = std::max(maximum_position_, position_);
}

void CountingSink::rewind(std::size_t previous_position) {
    if (previous_position > position_) {
        throw_bad_rewind(previous_position, position_);
    }
    position_ = previous_position;
}

}  // namespace wsformat
