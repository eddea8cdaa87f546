/**
 * @file GzipLayer.cpp
 * @brief gzip compression layer on zlib
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SinkLayers.hpp"

#include <algorithm>

namespace pgexport {

namespace {

constexpr int GZIP_WINDOW_BITS = 15 + 16;  // 32K window, gzip framing
constexpr std::size_t GZIP_CHUNK = 64 * 1024;

std::string zlib_message(const z_stream& stream, int code) {
    if (stream.msg != nullptr) {
        return stream.msg;
    }
    return "zlib error " + std::to_string(code);
}

}  // namespace

GzipLayer::GzipLayer(const std::string& path)
    : path_(path), out_(GZIP_CHUNK), logger_("GzipLayer") {
    int rc = deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw SinkError("error initializing gzip stream: " + zlib_message(stream_, rc), path_);
    }
    initialized_ = true;
}

GzipLayer::~GzipLayer() {
    if (initialized_) {
        deflateEnd(&stream_);
    }
}

void GzipLayer::pump(int flush_mode) {
    int rc = Z_OK;
    do {
        stream_.next_out = out_.data();
        stream_.avail_out = static_cast<uInt>(out_.size());

        rc = deflate(&stream_, flush_mode);
        if (rc == Z_STREAM_ERROR) {
            throw SinkError("error writing gzip stream: " + zlib_message(stream_, rc), path_);
        }

        std::size_t produced = out_.size() - stream_.avail_out;
        if (produced > 0) {
            next()->write(reinterpret_cast<const char*>(out_.data()), produced);
        }
    } while (stream_.avail_out == 0 || (flush_mode == Z_FINISH && rc != Z_STREAM_END));
}

void GzipLayer::write(const char* data, std::size_t size) {
    while (size > 0) {
        // avail_in is 32-bit
        uInt chunk = static_cast<uInt>(std::min<std::size_t>(size, 1u << 30));
        stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
        stream_.avail_in = chunk;
        pump(Z_NO_FLUSH);
        data += chunk;
        size -= chunk;
    }
}

void GzipLayer::close() {
    logger_.debug("Finalizing gzip compression for: " + path_);
    stream_.next_in = nullptr;
    stream_.avail_in = 0;
    pump(Z_FINISH);
    deflateEnd(&stream_);
    initialized_ = false;
}

}  // namespace pgexport
