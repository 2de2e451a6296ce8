//
//  byte_source.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dsdslicer {

/**
 * @brief Read-only, randomly addressable byte sequence (a source container).
 *
 * Implementations must allow concurrent `read_at` calls from several worker threads.
 */
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    /// Total number of addressable bytes.
    virtual uint64_t size() const = 0;

    /// Copy `len` bytes starting at `offset` into `dst`. Returns false on a short or failed read.
    virtual bool read_at(uint64_t offset, uint8_t *dst, size_t len) const = 0;
};

/// Source backed by an in-memory buffer (tests, small files, already-loaded data).
class MemoryByteSource : public ByteSource {
   public:
    explicit MemoryByteSource(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    uint64_t size() const override { return bytes_.size(); }
    bool read_at(uint64_t offset, uint8_t *dst, size_t len) const override;

    const std::vector<uint8_t> &bytes() const { return bytes_; }

   private:
    std::vector<uint8_t> bytes_;
};

/// Source backed by a file; only the requested ranges are ever read.
class FileByteSource : public ByteSource {
    struct OpenKey {
        explicit OpenKey() = default;
    };

   public:
    /// Open `path`; returns nullptr (and logs) when the file cannot be opened.
    static std::unique_ptr<FileByteSource> open(const std::string &path);

    uint64_t size() const override { return size_; }
    bool read_at(uint64_t offset, uint8_t *dst, size_t len) const override;

    const std::string &path() const { return path_; }

    /// Use open(); the key keeps construction inside this class.
    FileByteSource(OpenKey, std::string path, std::ifstream in, uint64_t size)
        : path_(std::move(path)), in_(std::move(in)), size_(size) {}

   private:
    std::string path_;
    mutable std::ifstream in_;
    mutable std::mutex mutex_;  // Protects seek+read on in_
    uint64_t size_ = 0;
};

}  // namespace dsdslicer
