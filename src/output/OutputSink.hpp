/**
 * @file OutputSink.hpp
 * @brief Write destination for one export, composed of ordered layers
 *
 * A sink is a chain such as gzip -> 256 KB buffer -> file. Writes enter
 * the first layer; closing walks the chain in the same order so every
 * layer can emit its trailer into the next one before that one closes.
 * The first close failure is rethrown once every layer has been tried.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "pgexport.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pgexport {

constexpr std::size_t SINK_BUFFER_SIZE = 256 * 1024;

/**
 * @brief One stage of a sink chain
 *
 * Layers forward their output to next(), which is owned by the sink.
 */
class SinkLayer {
public:
    virtual ~SinkLayer() = default;

    virtual void write(const char* data, std::size_t size) = 0;

    /// Push buffered bytes downstream without ending the stream
    virtual void flush() {}

    /// Finish the stream; called exactly once by the owning sink
    virtual void close() = 0;

    virtual const char* name() const = 0;

    void set_next(SinkLayer* next) { next_ = next; }

protected:
    SinkLayer* next() const { return next_; }

private:
    SinkLayer* next_ = nullptr;
};

/**
 * @brief Exclusive write owner for one export call
 */
class OutputSink {
public:
    /**
     * @param path Effective output path (after extension rewriting)
     * @param layers Chain in write order; the last layer owns the file
     */
    OutputSink(std::string path, std::vector<std::unique_ptr<SinkLayer>> layers);

    /// Closes best-effort if close() was never called
    ~OutputSink();

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;

    void write(const char* data, std::size_t size);
    void write(std::string_view text) { write(text.data(), text.size()); }

    void flush();

    /**
     * @brief Close every layer in chain order
     *
     * Each layer is closed even if an earlier one failed; the first
     * failure is rethrown afterwards. Calling close() again is a no-op.
     */
    void close();

    bool is_closed() const { return closed_; }
    const std::string& path() const { return path_; }

    /// Layer names in write order, e.g. {"gzip", "buffer", "file"}
    std::vector<std::string> layer_names() const;

private:
    std::string path_;
    std::vector<std::unique_ptr<SinkLayer>> layers_;
    bool closed_ = false;
};

/**
 * @brief Inputs for building a sink
 */
struct SinkConfig {
    std::string path;
    std::string compression = COMPRESSION_NONE;
    std::string format;
};

using SinkFactory = std::function<std::unique_ptr<OutputSink>(const SinkConfig&)>;

/**
 * @brief Build the sink chain for a path and compression mode
 *
 * - none: buffer -> file
 * - gzip/zstd/lz4: compressor -> buffer -> file, appending .gz/.zst/.lz4
 *   unless the path already ends with it (case-insensitive)
 * - zip: single-entry archive at the path with its extension replaced by .zip
 *
 * @throws ConfigurationError for an unknown compression name
 * @throws SinkError if the file cannot be created
 */
std::unique_ptr<OutputSink> create_sink(const SinkConfig& config);

/// Lower-cased, trimmed compression name ("" becomes "none")
std::string normalize_compression(const std::string& compression);

bool is_supported_compression(const std::string& compression);

/**
 * @brief Path that create_sink() will actually write for this config
 */
std::string resolve_output_path(const SinkConfig& config);

/// Append ext unless the path already ends with it (case-insensitive)
std::string ensure_extension(const std::string& path, const std::string& ext);

/// Replace the final extension with ext unless it already matches (case-insensitive)
std::string fix_extension(const std::string& path, const std::string& ext);

/**
 * @brief Name of the single entry inside a zip archive
 *
 * Lower-cased base name with ".zip" stripped ("export" when nothing is
 * left), plus ".<format>" unless already present or the format is
 * "template".
 *
 * zip_entry_name("/a/DATA.ZIP", "json") == "data.json"
 */
std::string zip_entry_name(const std::string& output_path, const std::string& format);

}  // namespace pgexport
