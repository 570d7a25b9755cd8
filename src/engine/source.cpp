/**
 * @file source.cpp
 * @brief Buffer, stream and file sources
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/engine/source.h"

#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace kccomp {

namespace {

void feed_stream(std::istream& in, size_t chunk_size, Updatable& engine) {
    std::vector<char> chunk(chunk_size);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            engine.update(reinterpret_cast<const uint8_t*>(chunk.data()),
                          static_cast<size_t>(got));
        }
    }
}

} // anonymous namespace

void BufferSource::feedInto(Updatable& engine) const {
    engine.update(data_, len_);
}

StreamSource::StreamSource(std::istream& in, size_t chunk_size)
    : in_(in), chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {}

void StreamSource::feedInto(Updatable& engine) const {
    feed_stream(in_, chunk_size_, engine);
    if (in_.bad()) {
        throw std::runtime_error("Failed to read input stream");
    }
}

FileSource::FileSource(std::string path, size_t chunk_size)
    : path_(std::move(path)), chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {}

void FileSource::feedInto(Updatable& engine) const {
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open input file: " + path_);
    }
    feed_stream(file, chunk_size_, engine);
    if (file.bad()) {
        throw std::runtime_error("Failed to read input file: " + path_);
    }
}

} // namespace kccomp
