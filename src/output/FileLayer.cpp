/**
 * @file FileLayer.cpp
 * @brief Plain file and fixed-size buffer layers
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SinkLayers.hpp"

#include <cerrno>
#include <cstring>

namespace pgexport {

namespace {

std::string errno_text() {
    return errno != 0 ? std::string(std::strerror(errno)) : std::string("I/O error");
}

}  // namespace

// ============================================================================
// FileLayer
// ============================================================================

FileLayer::FileLayer(const std::string& path)
    : path_(path) {
    errno = 0;
    stream_.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        throw SinkError("error creating file: " + errno_text(), path_);
    }
}

FileLayer::~FileLayer() = default;

void FileLayer::write(const char* data, std::size_t size) {
    stream_.write(data, static_cast<std::streamsize>(size));
    if (!stream_) {
        throw SinkError("error writing file: " + errno_text(), path_);
    }
}

void FileLayer::flush() {
    stream_.flush();
    if (!stream_) {
        throw SinkError("error flushing file: " + errno_text(), path_);
    }
}

void FileLayer::close() {
    if (!stream_.is_open()) {
        return;
    }
    stream_.close();
    if (stream_.fail()) {
        throw SinkError("error closing file: " + errno_text(), path_);
    }
}

// ============================================================================
// BufferedLayer
// ============================================================================

BufferedLayer::BufferedLayer(std::size_t capacity)
    : buffer_(capacity) {
}

void BufferedLayer::write(const char* data, std::size_t size) {
    if (size >= buffer_.size()) {
        drain();
        next()->write(data, size);
        return;
    }
    if (used_ + size > buffer_.size()) {
        drain();
    }
    std::memcpy(buffer_.data() + used_, data, size);
    used_ += size;
}

void BufferedLayer::drain() {
    if (used_ == 0) {
        return;
    }
    std::size_t pending = used_;
    used_ = 0;
    next()->write(buffer_.data(), pending);
}

void BufferedLayer::flush() {
    drain();
}

void BufferedLayer::close() {
    drain();
}

}  // namespace pgexport
