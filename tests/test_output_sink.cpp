/**
 * @file test_output_sink.cpp
 * @brief Sink chains, path rewriting and the compressed stream formats
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "output/OutputSink.hpp"

#include <lz4frame.h>
#include <minizip/unzip.h>
#include <zlib.h>
#include <zstd.h>

using namespace pgexport;
using namespace pgexport::testing;

namespace {

std::string gunzip(const std::string& compressed) {
    z_stream stream{};
    // 16 + MAX_WBITS accepts the gzip wrapper only
    EXPECT_EQ(inflateInit2(&stream, 16 + MAX_WBITS), Z_OK);
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::string out;
    char buffer[4096];
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = sizeof(buffer);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            ADD_FAILURE() << "inflate failed with " << rc;
            break;
        }
        out.append(buffer, sizeof(buffer) - stream.avail_out);
    }
    inflateEnd(&stream);
    return out;
}

std::string unzstd(const std::string& compressed) {
    ZSTD_DStream* stream = ZSTD_createDStream();
    ZSTD_initDStream(stream);
    ZSTD_inBuffer input{compressed.data(), compressed.size(), 0};

    std::string out;
    std::vector<char> buffer(ZSTD_DStreamOutSize());
    while (input.pos < input.size) {
        ZSTD_outBuffer output{buffer.data(), buffer.size(), 0};
        size_t rc = ZSTD_decompressStream(stream, &output, &input);
        if (ZSTD_isError(rc)) {
            ADD_FAILURE() << ZSTD_getErrorName(rc);
            break;
        }
        out.append(buffer.data(), output.pos);
    }
    ZSTD_freeDStream(stream);
    return out;
}

std::string unlz4(const std::string& compressed) {
    LZ4F_dctx* context = nullptr;
    EXPECT_FALSE(LZ4F_isError(LZ4F_createDecompressionContext(&context, LZ4F_VERSION)));

    std::string out;
    std::vector<char> buffer(64 * 1024);
    const char* src = compressed.data();
    size_t remaining = compressed.size();
    while (remaining > 0) {
        size_t dst_size = buffer.size();
        size_t src_size = remaining;
        size_t rc = LZ4F_decompress(context, buffer.data(), &dst_size, src, &src_size, nullptr);
        if (LZ4F_isError(rc)) {
            ADD_FAILURE() << LZ4F_getErrorName(rc);
            break;
        }
        out.append(buffer.data(), dst_size);
        src += src_size;
        remaining -= src_size;
        if (rc == 0) {
            break;
        }
    }
    LZ4F_freeDecompressionContext(context);
    return out;
}

struct ZipEntry {
    std::string name;
    std::string content;
    int entries = 0;
};

ZipEntry read_single_entry(const std::string& path) {
    ZipEntry entry;
    unzFile archive = unzOpen64(path.c_str());
    if (archive == nullptr) {
        ADD_FAILURE() << "cannot open archive " << path;
        return entry;
    }

    unz_global_info64 info{};
    unzGetGlobalInfo64(archive, &info);
    entry.entries = static_cast<int>(info.number_entry);

    if (unzGoToFirstFile(archive) == UNZ_OK) {
        char name[256];
        unz_file_info64 file_info{};
        unzGetCurrentFileInfo64(archive, &file_info, name, sizeof(name), nullptr, 0, nullptr, 0);
        entry.name = name;

        unzOpenCurrentFile(archive);
        char buffer[4096];
        int read = 0;
        while ((read = unzReadCurrentFile(archive, buffer, sizeof(buffer))) > 0) {
            entry.content.append(buffer, static_cast<size_t>(read));
        }
        unzCloseCurrentFile(archive);
    }
    unzClose(archive);
    return entry;
}

std::string write_through(const SinkConfig& config, const std::string& payload) {
    auto sink = create_sink(config);
    sink->write(payload);
    sink->close();
    return sink->path();
}

}  // namespace

TEST(OutputPathTest, CompressionExtensions) {
    EXPECT_EQ(resolve_output_path({"out.csv", "gzip", "csv"}), "out.csv.gz");
    EXPECT_EQ(resolve_output_path({"out.csv.GZ", "gzip", "csv"}), "out.csv.GZ");
    EXPECT_EQ(resolve_output_path({"out.json", "zstd", "json"}), "out.json.zst");
    EXPECT_EQ(resolve_output_path({"out.json", "lz4", "json"}), "out.json.lz4");
    EXPECT_EQ(resolve_output_path({"out.csv", "none", "csv"}), "out.csv");
    EXPECT_EQ(resolve_output_path({"dir/out.csv", "zip", "csv"}), "dir/out.zip");
    EXPECT_EQ(resolve_output_path({"dir/OUT.ZIP", "zip", "csv"}), "dir/OUT.ZIP");
    EXPECT_EQ(resolve_output_path({"dir.v2/out", "zip", "csv"}), "dir.v2/out.zip");
}

TEST(OutputPathTest, ZipEntryNames) {
    EXPECT_EQ(zip_entry_name("/a/DATA.ZIP", "json"), "data.json");
    EXPECT_EQ(zip_entry_name("/a/report.csv", "csv"), "report.csv");
    EXPECT_EQ(zip_entry_name("/a/out.csv.zip", "csv"), "out.csv");
    EXPECT_EQ(zip_entry_name("/a/.zip", "xml"), "export.xml");
    EXPECT_EQ(zip_entry_name("/a/page.html", "template"), "page.html");
}

TEST(OutputPathTest, NormalizeCompression) {
    EXPECT_EQ(normalize_compression(""), "none");
    EXPECT_EQ(normalize_compression("  GZip "), "gzip");
    EXPECT_TRUE(is_supported_compression("ZSTD"));
    EXPECT_FALSE(is_supported_compression("brotli"));
}

TEST(OutputSinkTest, LayerChains) {
    TempDir dir;
    EXPECT_EQ(create_sink({dir.file("a.csv"), "none", "csv"})->layer_names(),
              (std::vector<std::string>{"buffer", "file"}));
    EXPECT_EQ(create_sink({dir.file("b.csv"), "gzip", "csv"})->layer_names(),
              (std::vector<std::string>{"gzip", "buffer", "file"}));
    EXPECT_EQ(create_sink({dir.file("c.csv"), "zstd", "csv"})->layer_names(),
              (std::vector<std::string>{"zstd", "buffer", "file"}));
    EXPECT_EQ(create_sink({dir.file("d.csv"), "lz4", "csv"})->layer_names(),
              (std::vector<std::string>{"lz4", "buffer", "file"}));
    EXPECT_EQ(create_sink({dir.file("e.csv"), "zip", "csv"})->layer_names(),
              (std::vector<std::string>{"zip"}));
}

TEST(OutputSinkTest, UnsupportedCompressionIsConfigurationError) {
    TempDir dir;
    try {
        create_sink({dir.file("x.csv"), "rar", "csv"});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_STREQ(e.what(), "unsupported compression type \"rar\"");
    }
}

TEST(OutputSinkTest, MissingDirectoryIsSinkError) {
    TempDir dir;
    EXPECT_THROW(create_sink({dir.file("missing/x.csv"), "none", "csv"}), SinkError);
}

TEST(OutputSinkTest, PlainFileContent) {
    TempDir dir;
    std::string path = write_through({dir.file("plain.csv"), "none", "csv"}, "id,name\n1,a\n");
    EXPECT_EQ(read_file(path), "id,name\n1,a\n");
}

TEST(OutputSinkTest, CloseIsIdempotentAndWriteAfterCloseFails) {
    TempDir dir;
    auto sink = create_sink({dir.file("twice.csv"), "none", "csv"});
    sink->write("x");
    sink->close();
    EXPECT_TRUE(sink->is_closed());
    EXPECT_NO_THROW(sink->close());
    EXPECT_THROW(sink->write("y"), SinkError);
    EXPECT_EQ(read_file(sink->path()), "x");
}

TEST(OutputSinkTest, CaptureLayerClosedOnce) {
    auto capture = std::make_shared<SinkCapture>();
    auto sink = capture_sink_factory(capture)({"mem.csv", "none", "csv"});
    sink->write("abc");
    sink->close();
    sink->close();
    EXPECT_EQ(capture->data, "abc");
    EXPECT_EQ(capture->close_count, 1);
}

TEST(CompressionTest, GzipStreamDecodes) {
    TempDir dir;
    std::string payload;
    for (int i = 0; i < 5000; ++i) {
        payload += std::to_string(i) + ",row\n";
    }
    std::string path = write_through({dir.file("data.csv"), "gzip", "csv"}, payload);
    EXPECT_EQ(path, dir.file("data.csv.gz"));
    EXPECT_EQ(gunzip(read_file(path)), payload);
}

TEST(CompressionTest, ZstdStreamDecodes) {
    TempDir dir;
    std::string payload(300000, 'z');
    std::string path = write_through({dir.file("data.json"), "zstd", "json"}, payload);
    EXPECT_EQ(path, dir.file("data.json.zst"));
    EXPECT_EQ(unzstd(read_file(path)), payload);
}

TEST(CompressionTest, Lz4FrameDecodes) {
    TempDir dir;
    std::string payload;
    for (int i = 0; i < 2000; ++i) {
        payload += "<row>" + std::to_string(i) + "</row>\n";
    }
    std::string path = write_through({dir.file("data.xml"), "lz4", "xml"}, payload);
    EXPECT_EQ(path, dir.file("data.xml.lz4"));
    EXPECT_EQ(unlz4(read_file(path)), payload);
}

TEST(CompressionTest, ZipHoldsSingleEntry) {
    TempDir dir;
    std::string path = write_through({dir.file("Report.csv"), "zip", "csv"}, "a,b\n1,2\n");
    EXPECT_EQ(path, dir.file("Report.zip"));

    ZipEntry entry = read_single_entry(path);
    EXPECT_EQ(entry.entries, 1);
    EXPECT_EQ(entry.name, "report.csv");
    EXPECT_EQ(entry.content, "a,b\n1,2\n");
}
