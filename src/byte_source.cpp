//
//  byte_source.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "byte_source.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include "logging.hpp"

namespace dsdslicer {

bool MemoryByteSource::read_at(uint64_t offset, uint8_t *dst, size_t len) const {
    if (offset > bytes_.size() || len > bytes_.size() - offset) {
        return false;
    }
    if (len > 0) {
        std::memcpy(dst, bytes_.data() + offset, len);
    }
    return true;
}

std::unique_ptr<FileByteSource> FileByteSource::open(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        DS_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return nullptr;
    }
    in.seekg(0, std::ios::end);
    const std::streamoff len = in.tellg();
    if (len < 0) {
        DS_LOG("error", "cannot determine size of " << path);
        return nullptr;
    }
    in.seekg(0, std::ios::beg);
    DS_LOG("io", "opened source " << path << " size=" << len);
    return std::make_unique<FileByteSource>(OpenKey{}, path, std::move(in),
                                            static_cast<uint64_t>(len));
}

bool FileByteSource::read_at(uint64_t offset, uint8_t *dst, size_t len) const {
    if (offset > size_ || len > size_ - offset) {
        return false;
    }
    if (len == 0) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    in_.read(reinterpret_cast<char *>(dst), static_cast<std::streamsize>(len));
    if (in_.gcount() != static_cast<std::streamsize>(len)) {
        DS_LOG("io", "short read at " << offset << " wanted=" << len << " got=" << in_.gcount());
        return false;
    }
    return true;
}

}  // namespace dsdslicer
