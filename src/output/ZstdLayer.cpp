/**
 * @file ZstdLayer.cpp
 * @brief zstd compression layer on the streaming API
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SinkLayers.hpp"

namespace pgexport {

ZstdLayer::ZstdLayer(const std::string& path)
    : path_(path), out_(ZSTD_CStreamOutSize()), logger_("ZstdLayer") {
    context_ = ZSTD_createCCtx();
    if (context_ == nullptr) {
        throw SinkError("error initializing zstd stream: out of memory", path_);
    }
    size_t rc = ZSTD_CCtx_setParameter(context_, ZSTD_c_compressionLevel, ZSTD_CLEVEL_DEFAULT);
    if (ZSTD_isError(rc)) {
        ZSTD_freeCCtx(context_);
        context_ = nullptr;
        throw SinkError(std::string("error initializing zstd stream: ") + ZSTD_getErrorName(rc), path_);
    }
}

ZstdLayer::~ZstdLayer() {
    if (context_ != nullptr) {
        ZSTD_freeCCtx(context_);
    }
}

void ZstdLayer::write(const char* data, std::size_t size) {
    ZSTD_inBuffer input{data, size, 0};
    while (input.pos < input.size) {
        ZSTD_outBuffer output{out_.data(), out_.size(), 0};
        size_t rc = ZSTD_compressStream2(context_, &output, &input, ZSTD_e_continue);
        if (ZSTD_isError(rc)) {
            throw SinkError(std::string("error writing zstd stream: ") + ZSTD_getErrorName(rc), path_);
        }
        if (output.pos > 0) {
            next()->write(out_.data(), output.pos);
        }
    }
}

void ZstdLayer::close() {
    logger_.debug("Finalizing zstd compression for: " + path_);

    ZSTD_inBuffer input{nullptr, 0, 0};
    size_t remaining = 0;
    do {
        ZSTD_outBuffer output{out_.data(), out_.size(), 0};
        remaining = ZSTD_compressStream2(context_, &output, &input, ZSTD_e_end);
        if (ZSTD_isError(remaining)) {
            throw SinkError(std::string("error finishing zstd stream: ") + ZSTD_getErrorName(remaining), path_);
        }
        if (output.pos > 0) {
            next()->write(out_.data(), output.pos);
        }
    } while (remaining != 0);

    ZSTD_freeCCtx(context_);
    context_ = nullptr;
}

}  // namespace pgexport
