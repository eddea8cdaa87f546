/**
 * @file Lz4Layer.cpp
 * @brief LZ4 frame compression layer
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SinkLayers.hpp"

#include <algorithm>

namespace pgexport {

Lz4Layer::Lz4Layer(const std::string& path)
    : path_(path), logger_("Lz4Layer") {
    LZ4F_errorCode_t rc = LZ4F_createCompressionContext(&context_, LZ4F_VERSION);
    if (LZ4F_isError(rc)) {
        throw SinkError(std::string("error initializing lz4 stream: ") + LZ4F_getErrorName(rc), path_);
    }
    out_.resize(std::max<std::size_t>(LZ4F_compressBound(CHUNK_SIZE, &preferences_), LZ4F_HEADER_SIZE_MAX));
}

Lz4Layer::~Lz4Layer() {
    if (context_ != nullptr) {
        LZ4F_freeCompressionContext(context_);
    }
}

void Lz4Layer::write(const char* data, std::size_t size) {
    if (!started_) {
        size_t header = LZ4F_compressBegin(context_, out_.data(), out_.size(), &preferences_);
        if (LZ4F_isError(header)) {
            throw SinkError(std::string("error writing lz4 header: ") + LZ4F_getErrorName(header), path_);
        }
        next()->write(out_.data(), header);
        started_ = true;
    }

    while (size > 0) {
        std::size_t chunk = std::min(size, CHUNK_SIZE);
        size_t produced = LZ4F_compressUpdate(context_, out_.data(), out_.size(), data, chunk, nullptr);
        if (LZ4F_isError(produced)) {
            throw SinkError(std::string("error writing lz4 stream: ") + LZ4F_getErrorName(produced), path_);
        }
        if (produced > 0) {
            next()->write(out_.data(), produced);
        }
        data += chunk;
        size -= chunk;
    }
}

void Lz4Layer::close() {
    logger_.debug("Finalizing lz4 compression for: " + path_);

    // An empty export still produces a valid (empty) frame.
    if (!started_) {
        write(nullptr, 0);
    }

    size_t produced = LZ4F_compressEnd(context_, out_.data(), out_.size(), nullptr);
    if (LZ4F_isError(produced)) {
        throw SinkError(std::string("error finishing lz4 stream: ") + LZ4F_getErrorName(produced), path_);
    }
    if (produced > 0) {
        next()->write(out_.data(), produced);
    }

    LZ4F_freeCompressionContext(context_);
    context_ = nullptr;
}

}  // namespace pgexport
