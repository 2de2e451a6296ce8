//
//  dsf_chunks.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// DSF layout constants (Sony DSF file format specification 1.01).
inline constexpr uint64_t kChunkHeaderSize = 12;  // id (4) + little-endian size (8)
inline constexpr uint64_t kDsdChunkSize = 28;
inline constexpr uint64_t kFmtChunkSize = 52;
inline constexpr uint64_t kDataChunkHeaderSize = kChunkHeaderSize;
inline constexpr uint64_t kDataRegionOffset = kDsdChunkSize + kFmtChunkSize + kDataChunkHeaderSize;
inline constexpr uint32_t kDsfFormatVersion = 1;
inline constexpr uint32_t kDsfFormatRawDsd = 0;

// FourCC helpers. Ids are packed big-endian so that 'DSD ' compares like the bytes on disk.
inline constexpr uint32_t fourcc(const char a, const char b, const char c, const char d) {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | (uint32_t(uint8_t(d)));
}

inline constexpr uint32_t fourcc(const char t[4]) { return fourcc(t[0], t[1], t[2], t[3]); }

inline constexpr uint32_t fourcc(const uint8_t *p) {
    return fourcc(static_cast<char>(p[0]), static_cast<char>(p[1]), static_cast<char>(p[2]),
                  static_cast<char>(p[3]));
}

inline std::string fourcc_to_string(uint32_t type) {
    std::string s(4, ' ');
    for (int i = 0; i < 4; ++i) {
        const char c = static_cast<char>((type >> (24 - 8 * i)) & 0xFF);
        s[i] = (c >= 0x20 && c <= 0x7E) ? c : '?';
    }
    return s;
}

// Forward declaration.
class Chunk;

using ChunkPtr = std::unique_ptr<Chunk>;

// A DSF chunk: 4-byte id, 8-byte little-endian total size (header included), payload.
class Chunk {
   public:
    uint32_t id = 0;               // FourCC
    std::vector<uint8_t> payload;  // Raw payload (after the 12-byte header)

    uint64_t chunk_size = 0;  // Computed via fix_size()

    Chunk() = default;
    explicit Chunk(uint32_t t) : id(t) {}
    explicit Chunk(const char t[4]) : id(fourcc(t)) {}

    // Factory.
    static ChunkPtr create(const char t[4]);

    // Size computation (header + payload).
    void fix_size();

    // Return size (must call fix_size first)
    uint64_t size() const;

    // Append header + payload to a buffer.
    void write(std::vector<uint8_t> &out) const;
};

// Append a bare chunk header (used for the data chunk, whose payload is streamed in place).
void write_chunk_header(std::vector<uint8_t> &out, uint32_t id, uint64_t size);

// ------------- Helper write functions ---------------------------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

// Big-endian, used by the ID3v2 tag.
inline void write_u16(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u32(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

// Little-endian, used by every DSF header field.
inline void write_u32le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

inline void write_u64le(std::vector<uint8_t> &p, uint64_t v) {
    write_u32le(p, static_cast<uint32_t>(v & 0xFFFFFFFFULL));
    write_u32le(p, static_cast<uint32_t>(v >> 32));
}

inline void write_fourcc(std::vector<uint8_t> &p, uint32_t id) { write_u32(p, id); }

// Overwrite a little-endian u64 already present in the buffer.
inline void patch_u64le(std::vector<uint8_t> &p, size_t pos, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[pos + i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

// ------------- Helper read functions ----------------------------------------

inline uint32_t read_u32le(const uint8_t *p) {
    return (uint32_t(p[0])) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) |
           (uint32_t(p[3]) << 24);
}

inline uint64_t read_u64le(const uint8_t *p) {
    return uint64_t(read_u32le(p)) | (uint64_t(read_u32le(p + 4)) << 32);
}
