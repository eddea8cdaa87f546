/**
 * @file SinkLayers.hpp
 * @brief Concrete sink layers: file, buffer and the streaming compressors
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "OutputSink.hpp"
#include "../core/Logger.hpp"

#include <fstream>
#include <string>
#include <vector>

#include <lz4frame.h>
#include <minizip/zip.h>
#include <zlib.h>
#include <zstd.h>

namespace pgexport {

/**
 * @brief Terminal layer writing to a regular file
 */
class FileLayer : public SinkLayer {
public:
    /// @throws SinkError "error creating file"
    explicit FileLayer(const std::string& path);
    ~FileLayer() override;

    void write(const char* data, std::size_t size) override;
    void flush() override;
    void close() override;
    const char* name() const override { return "file"; }

private:
    std::string path_;
    std::ofstream stream_;
};

/**
 * @brief Fixed-size write buffer in front of the next layer
 */
class BufferedLayer : public SinkLayer {
public:
    explicit BufferedLayer(std::size_t capacity = SINK_BUFFER_SIZE);

    void write(const char* data, std::size_t size) override;
    void flush() override;
    void close() override;
    const char* name() const override { return "buffer"; }

private:
    std::vector<char> buffer_;
    std::size_t used_ = 0;

    void drain();
};

/**
 * @brief gzip stream through zlib deflate
 */
class GzipLayer : public SinkLayer {
public:
    explicit GzipLayer(const std::string& path);
    ~GzipLayer() override;

    void write(const char* data, std::size_t size) override;
    void close() override;
    const char* name() const override { return "gzip"; }

private:
    std::string path_;
    z_stream stream_{};
    bool initialized_ = false;
    std::vector<unsigned char> out_;
    Logger logger_;

    void pump(int flush_mode);
};

/**
 * @brief zstd frame through the streaming compression API
 */
class ZstdLayer : public SinkLayer {
public:
    explicit ZstdLayer(const std::string& path);
    ~ZstdLayer() override;

    void write(const char* data, std::size_t size) override;
    void close() override;
    const char* name() const override { return "zstd"; }

private:
    std::string path_;
    ZSTD_CCtx* context_ = nullptr;
    std::vector<char> out_;
    Logger logger_;
};

/**
 * @brief LZ4 frame through the lz4frame API
 */
class Lz4Layer : public SinkLayer {
public:
    explicit Lz4Layer(const std::string& path);
    ~Lz4Layer() override;

    void write(const char* data, std::size_t size) override;
    void close() override;
    const char* name() const override { return "lz4"; }

private:
    static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

    std::string path_;
    LZ4F_cctx* context_ = nullptr;
    LZ4F_preferences_t preferences_{};
    bool started_ = false;
    std::vector<char> out_;
    Logger logger_;
};

/**
 * @brief Single deflated entry inside a zip archive
 *
 * Owns the archive file itself, so it is always the only layer.
 */
class ZipLayer : public SinkLayer {
public:
    /// @throws SinkError "error creating file" or "error creating zip entry"
    ZipLayer(const std::string& archive_path, const std::string& entry_name);
    ~ZipLayer() override;

    void write(const char* data, std::size_t size) override;
    void close() override;
    const char* name() const override { return "zip"; }

private:
    std::string path_;
    zipFile archive_ = nullptr;
    bool entry_open_ = false;
    Logger logger_;
};

}  // namespace pgexport
