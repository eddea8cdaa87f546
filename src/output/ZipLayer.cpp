/**
 * @file ZipLayer.cpp
 * @brief Single-entry zip archive output on minizip
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SinkLayers.hpp"

#include <algorithm>
#include <ctime>

namespace pgexport {

namespace {

zip_fileinfo entry_info() {
    zip_fileinfo info{};
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    info.tmz_date.tm_sec = static_cast<uInt>(local.tm_sec);
    info.tmz_date.tm_min = static_cast<uInt>(local.tm_min);
    info.tmz_date.tm_hour = static_cast<uInt>(local.tm_hour);
    info.tmz_date.tm_mday = static_cast<uInt>(local.tm_mday);
    info.tmz_date.tm_mon = static_cast<uInt>(local.tm_mon);
    info.tmz_date.tm_year = static_cast<uInt>(local.tm_year + 1900);
    return info;
}

}  // namespace

ZipLayer::ZipLayer(const std::string& archive_path, const std::string& entry_name)
    : path_(archive_path), logger_("ZipLayer") {
    archive_ = zipOpen64(path_.c_str(), APPEND_STATUS_CREATE);
    if (archive_ == nullptr) {
        throw SinkError("error creating file", path_);
    }

    zip_fileinfo info = entry_info();
    int rc = zipOpenNewFileInZip64(archive_, entry_name.c_str(), &info,
                                   nullptr, 0, nullptr, 0, nullptr,
                                   Z_DEFLATED, Z_DEFAULT_COMPRESSION, 1);
    if (rc != ZIP_OK) {
        zipClose(archive_, nullptr);
        archive_ = nullptr;
        throw SinkError("error creating zip entry " + entry_name, path_);
    }
    entry_open_ = true;
    logger_.debug("Opened zip entry " + entry_name + " in " + path_);
}

ZipLayer::~ZipLayer() {
    if (entry_open_) {
        zipCloseFileInZip(archive_);
    }
    if (archive_ != nullptr) {
        zipClose(archive_, nullptr);
    }
}

void ZipLayer::write(const char* data, std::size_t size) {
    while (size > 0) {
        unsigned chunk = static_cast<unsigned>(std::min<std::size_t>(size, 1u << 30));
        if (zipWriteInFileInZip(archive_, data, chunk) != ZIP_OK) {
            throw SinkError("error writing zip entry", path_);
        }
        data += chunk;
        size -= chunk;
    }
}

void ZipLayer::close() {
    logger_.debug("Finalizing zip archive: " + path_);

    // Both steps are attempted; the entry failure wins if both fail.
    int entry_rc = ZIP_OK;
    if (entry_open_) {
        entry_rc = zipCloseFileInZip(archive_);
        entry_open_ = false;
    }
    int archive_rc = ZIP_OK;
    if (archive_ != nullptr) {
        archive_rc = zipClose(archive_, nullptr);
        archive_ = nullptr;
    }

    if (entry_rc != ZIP_OK) {
        throw SinkError("error closing zip entry", path_);
    }
    if (archive_rc != ZIP_OK) {
        throw SinkError("error closing zip archive", path_);
    }
}

}  // namespace pgexport
