/**
 * @file source.h
 * @brief Input sources feeding streaming engines
 *
 * An engine that consumes input implements Updatable; every source variant
 * knows how to push its bytes into one through feedInto(). Reading is always
 * a sequence of update() calls over chunks, so engine results never depend on
 * where the bytes came from.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_ENGINE_SOURCE_H
#define KCCOMP_ENGINE_SOURCE_H

#include "kccomp/core/types.h"

#include <istream>
#include <string>

namespace kccomp {

/** Default chunk size for stream and file sources */
constexpr size_t kDefaultChunkSize = 8192;

/**
 * @brief Sink side: anything accepting incremental input
 */
class Updatable {
public:
    virtual ~Updatable() = default;
    virtual void update(const uint8_t* data, size_t len) = 0;
};

/**
 * @brief Source side: one implementation per input variant
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    /**
     * @brief Push every byte of the source into the engine, in order
     */
    virtual void feedInto(Updatable& engine) const = 0;
};

/**
 * @brief In-memory bytes; the source borrows the buffer
 */
class BufferSource : public DataSource {
public:
    BufferSource(const uint8_t* data, size_t len) : data_(data), len_(len) {}
    explicit BufferSource(const ByteVec& data) : data_(data.data()), len_(data.size()) {}
    explicit BufferSource(const std::string& data)
        : data_(reinterpret_cast<const uint8_t*>(data.data())), len_(data.size()) {}

    void feedInto(Updatable& engine) const override;

private:
    const uint8_t* data_;
    size_t len_;
};

/**
 * @brief A std::istream read to end of file in chunks
 *
 * The stream is consumed; feeding twice feeds only what is left.
 */
class StreamSource : public DataSource {
public:
    explicit StreamSource(std::istream& in, size_t chunk_size = kDefaultChunkSize);

    void feedInto(Updatable& engine) const override;

private:
    std::istream& in_;
    size_t chunk_size_;
};

/**
 * @brief A file opened on each feed and read in chunks
 *
 * @throws std::runtime_error from feedInto() when the file cannot be read
 */
class FileSource : public DataSource {
public:
    explicit FileSource(std::string path, size_t chunk_size = kDefaultChunkSize);

    void feedInto(Updatable& engine) const override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    size_t chunk_size_;
};

} // namespace kccomp

#endif // KCCOMP_ENGINE_SOURCE_H
