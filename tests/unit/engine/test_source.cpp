/**
 * @file test_source.cpp
 * @brief DataSource unit tests: buffers, streams and files feed identically
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "kccomp/kccomp.h"

using kccomp::ByteVec;
using kccomp::DigestAlgorithm;

namespace {

// Records every update() call
class RecordingSink : public kccomp::Updatable {
public:
    void update(const uint8_t* data, size_t len) override {
        calls++;
        bytes.insert(bytes.end(), data, data + len);
    }

    size_t calls = 0;
    ByteVec bytes;
};

ByteVec make_pattern(size_t n) {
    ByteVec v(n);
    for (size_t i = 0; i < n; i++) {
        v[i] = static_cast<uint8_t>((i * 131 + 7) & 0xFF);
    }
    return v;
}

} // anonymous namespace

class SourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        kccomp_init();
        path_ = ::testing::TempDir() + "kccomp_source_test.bin";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void writeFile(const ByteVec& data) {
        std::ofstream out(path_, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    std::string path_;
};

TEST_F(SourceTest, BufferSourceFeedsOnce) {
    ByteVec data = make_pattern(100);
    RecordingSink sink;
    kccomp::BufferSource(data).feedInto(sink);

    EXPECT_EQ(sink.calls, 1u);
    EXPECT_EQ(sink.bytes, data);
}

TEST_F(SourceTest, StreamSourceFeedsInChunks) {
    ByteVec data = make_pattern(1000);
    std::istringstream in(std::string(data.begin(), data.end()));

    RecordingSink sink;
    kccomp::StreamSource(in, 64).feedInto(sink);

    EXPECT_EQ(sink.calls, 16u);
    EXPECT_EQ(sink.bytes, data);
}

TEST_F(SourceTest, FileSourceMatchesBufferDigest) {
    ByteVec data = make_pattern(3 * kccomp::kDefaultChunkSize + 17);
    writeFile(data);

    kccomp::FileSource file(path_);
    EXPECT_EQ(file.path(), path_);
    EXPECT_EQ(kccomp::digest(DigestAlgorithm::SHA256, file),
              kccomp::digest(DigestAlgorithm::SHA256, data));

    // The file is reopened on every feed
    EXPECT_EQ(kccomp::digest(DigestAlgorithm::SHA256, file),
              kccomp::digest(DigestAlgorithm::SHA256, data));
}

TEST_F(SourceTest, EmptyFileFeedsNothing) {
    writeFile(ByteVec());
    RecordingSink sink;
    kccomp::FileSource(path_).feedInto(sink);
    EXPECT_TRUE(sink.bytes.empty());
}

TEST_F(SourceTest, MissingFileThrows) {
    RecordingSink sink;
    kccomp::FileSource missing(path_ + ".does-not-exist");
    EXPECT_THROW(missing.feedInto(sink), std::runtime_error);
}

TEST_F(SourceTest, MacAcceptsDataSource) {
    ByteVec key = kccomp::stringToBytes("key");
    ByteVec data = kccomp::stringToBytes("The quick brown fox jumps over the lazy dog");

    kccomp::Mac mac(kccomp::MacSpec::hmac(DigestAlgorithm::SHA256));
    mac.init(key);
    mac.update(kccomp::BufferSource(data));
    EXPECT_EQ(kccomp::hexEncode(mac.final()),
              "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}
