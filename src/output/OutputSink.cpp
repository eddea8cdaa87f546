/**
 * @file OutputSink.cpp
 * @brief Sink chain ownership, close aggregation and the sink factory
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "OutputSink.hpp"
#include "SinkLayers.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace pgexport {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool ends_with_ci(const std::string& value, const std::string& suffix) {
    return to_lower(value).ends_with(to_lower(suffix));
}

std::string base_name(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    auto slash = trimmed.find_last_of('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

/// Extension of the final path element including the dot, or ""
std::string extension_of(const std::string& path) {
    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return path.substr(dot);
}

std::vector<std::unique_ptr<SinkLayer>> buffered_file(const std::string& path) {
    std::vector<std::unique_ptr<SinkLayer>> layers;
    layers.push_back(std::make_unique<BufferedLayer>());
    layers.push_back(std::make_unique<FileLayer>(path));
    return layers;
}

}  // namespace

// ============================================================================
// OutputSink
// ============================================================================

OutputSink::OutputSink(std::string path, std::vector<std::unique_ptr<SinkLayer>> layers)
    : path_(std::move(path)), layers_(std::move(layers)) {
    for (size_t i = 0; i + 1 < layers_.size(); ++i) {
        layers_[i]->set_next(layers_[i + 1].get());
    }
}

OutputSink::~OutputSink() {
    if (closed_) {
        return;
    }
    try {
        close();
    } catch (const std::exception& e) {
        Logger("OutputSink").warning(std::string("Error closing output ") + path_ + ": " + e.what());
    }
}

void OutputSink::write(const char* data, std::size_t size) {
    if (closed_) {
        throw SinkError("write after close", path_);
    }
    if (size == 0 || layers_.empty()) {
        return;
    }
    layers_.front()->write(data, size);
}

void OutputSink::flush() {
    if (closed_) {
        return;
    }
    for (auto& layer : layers_) {
        layer->flush();
    }
}

void OutputSink::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    std::exception_ptr first_error;
    for (auto& layer : layers_) {
        try {
            layer->close();
        } catch (const std::exception&) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

std::vector<std::string> OutputSink::layer_names() const {
    std::vector<std::string> names;
    for (const auto& layer : layers_) {
        names.emplace_back(layer->name());
    }
    return names;
}

// ============================================================================
// Path helpers
// ============================================================================

std::string normalize_compression(const std::string& compression) {
    std::string value = compression;
    value.erase(0, value.find_first_not_of(" \t\n\r"));
    value.erase(value.find_last_not_of(" \t\n\r") + 1);
    value = to_lower(value);
    return value.empty() ? std::string(COMPRESSION_NONE) : value;
}

bool is_supported_compression(const std::string& compression) {
    std::string value = normalize_compression(compression);
    return value == COMPRESSION_NONE || value == COMPRESSION_GZIP || value == COMPRESSION_ZIP ||
           value == COMPRESSION_ZSTD || value == COMPRESSION_LZ4;
}

std::string ensure_extension(const std::string& path, const std::string& ext) {
    return ends_with_ci(path, ext) ? path : path + ext;
}

std::string fix_extension(const std::string& path, const std::string& ext) {
    std::string current = extension_of(path);
    if (to_lower(current) == to_lower(ext)) {
        return path;
    }
    return path.substr(0, path.size() - current.size()) + ext;
}

std::string zip_entry_name(const std::string& output_path, const std::string& format) {
    std::string name = to_lower(base_name(output_path));
    if (name.ends_with(".zip")) {
        name.erase(name.size() - 4);
    }
    if (name.empty()) {
        name = "export";
    }
    if (format != FORMAT_TEMPLATE && !name.ends_with("." + format)) {
        name += "." + format;
    }
    return name;
}

std::string resolve_output_path(const SinkConfig& config) {
    std::string compression = normalize_compression(config.compression);
    if (compression == COMPRESSION_GZIP) return ensure_extension(config.path, ".gz");
    if (compression == COMPRESSION_ZSTD) return ensure_extension(config.path, ".zst");
    if (compression == COMPRESSION_LZ4) return ensure_extension(config.path, ".lz4");
    if (compression == COMPRESSION_ZIP) return fix_extension(config.path, ".zip");
    return config.path;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<OutputSink> create_sink(const SinkConfig& config) {
    Logger logger("OutputSink");

    std::string compression = normalize_compression(config.compression);
    if (!is_supported_compression(compression)) {
        throw ConfigurationError("unsupported compression type \"" + config.compression + "\"");
    }

    std::string path = resolve_output_path(config);
    std::vector<std::unique_ptr<SinkLayer>> layers;

    if (compression == COMPRESSION_ZIP) {
        std::string entry = zip_entry_name(config.path, config.format);
        logger.debug("Creating zip-compressed output file: " + path + " (entry " + entry + ")");
        layers.push_back(std::make_unique<ZipLayer>(path, entry));
        return std::make_unique<OutputSink>(path, std::move(layers));
    }

    // File first so a creation failure is reported before any compressor allocates.
    auto tail = buffered_file(path);

    if (compression == COMPRESSION_NONE) {
        logger.debug("Creating uncompressed output file: " + path);
        return std::make_unique<OutputSink>(path, std::move(tail));
    }

    logger.debug("Creating " + compression + "-compressed output file: " + path);
    if (compression == COMPRESSION_GZIP) {
        layers.push_back(std::make_unique<GzipLayer>(path));
    } else if (compression == COMPRESSION_ZSTD) {
        layers.push_back(std::make_unique<ZstdLayer>(path));
    } else {
        layers.push_back(std::make_unique<Lz4Layer>(path));
    }
    for (auto& layer : tail) {
        layers.push_back(std::move(layer));
    }
    return std::make_unique<OutputSink>(path, std::move(layers));
}

}  // namespace pgexport
