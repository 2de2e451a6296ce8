// Synthetic DSF fixtures and bit helpers for tests only (kept independent of the
// library code to avoid self-consistency bugs).
#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace test_utils {

inline void put_le(std::vector<uint8_t> &out, uint64_t v, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

inline uint64_t get_le(const std::vector<uint8_t> &in, size_t pos, int bytes) {
    uint64_t v = 0;
    for (int i = bytes - 1; i >= 0; --i) {
        v = (v << 8) | in[pos + static_cast<size_t>(i)];
    }
    return v;
}

// Deterministic, position-dependent byte so that misplaced blocks or channels show up.
inline uint8_t pattern_byte(uint32_t channel, uint64_t j) {
    return static_cast<uint8_t>((j * 37 + channel * 101 + 11) & 0xFF);
}

// Logical (deinterleaved) bytes of one channel: ceil(samples/8) pattern bytes, tail bits zero.
inline std::vector<uint8_t> channel_pattern(uint32_t channel, uint64_t sample_count) {
    std::vector<uint8_t> v(static_cast<size_t>((sample_count + 7) / 8));
    for (size_t j = 0; j < v.size(); ++j) {
        v[j] = pattern_byte(channel, j);
    }
    if (sample_count % 8 != 0 && !v.empty()) {
        v.back() &= static_cast<uint8_t>(0xFF << (8 - sample_count % 8));
    }
    return v;
}

struct FixtureLayout {
    uint32_t channels = 2;
    uint32_t sampling_frequency = 7500;  // 100 samples per CD frame
    uint32_t block_size = 16;
    uint64_t sample_count = 0;
    uint32_t channel_type = 2;
    uint32_t format_id = 0;
    uint32_t bits_per_sample = 1;
    std::vector<uint8_t> tag;  // appended after the data chunk when non-empty
};

// Build a complete DSF file whose channel c carries `channels_data[c]` (zero padded to blocks).
inline std::vector<uint8_t> make_dsf(const FixtureLayout &fx,
                                     const std::vector<std::vector<uint8_t>> &channels_data) {
    const uint64_t bytes_per_channel = (fx.sample_count + 7) / 8;
    const uint64_t blocks = (bytes_per_channel + fx.block_size - 1) / fx.block_size;
    const uint64_t data_bytes = blocks * fx.block_size * fx.channels;
    const uint64_t file_size = 92 + data_bytes + fx.tag.size();

    std::vector<uint8_t> out;
    out.insert(out.end(), {'D', 'S', 'D', ' '});
    put_le(out, 28, 8);
    put_le(out, file_size, 8);
    put_le(out, fx.tag.empty() ? 0 : 92 + data_bytes, 8);

    out.insert(out.end(), {'f', 'm', 't', ' '});
    put_le(out, 52, 8);
    put_le(out, 1, 4);
    put_le(out, fx.format_id, 4);
    put_le(out, fx.channel_type, 4);
    put_le(out, fx.channels, 4);
    put_le(out, fx.sampling_frequency, 4);
    put_le(out, fx.bits_per_sample, 4);
    put_le(out, fx.sample_count, 8);
    put_le(out, fx.block_size, 4);
    put_le(out, 0, 4);

    out.insert(out.end(), {'d', 'a', 't', 'a'});
    put_le(out, 12 + data_bytes, 8);
    for (uint64_t b = 0; b < blocks; ++b) {
        for (uint32_t c = 0; c < fx.channels; ++c) {
            for (uint64_t i = 0; i < fx.block_size; ++i) {
                const uint64_t j = b * fx.block_size + i;
                const auto &src = channels_data[c];
                out.push_back(j < src.size() ? src[static_cast<size_t>(j)] : 0);
            }
        }
    }
    out.insert(out.end(), fx.tag.begin(), fx.tag.end());
    return out;
}

// Fixture with pattern data on every channel.
inline std::vector<uint8_t> make_pattern_dsf(const FixtureLayout &fx) {
    std::vector<std::vector<uint8_t>> data;
    for (uint32_t c = 0; c < fx.channels; ++c) {
        data.push_back(channel_pattern(c, fx.sample_count));
    }
    return make_dsf(fx, data);
}

// Read back channel c's logical bytes from a DSF file built by anyone.
struct ParsedDsf {
    uint32_t channels = 0;
    uint32_t sampling_frequency = 0;
    uint32_t block_size = 0;
    uint64_t sample_count = 0;
    uint64_t declared_file_size = 0;
    uint64_t metadata_offset = 0;
    uint64_t data_chunk_size = 0;
    std::vector<std::vector<uint8_t>> channel_bytes;  // ceil(sample_count/8) per channel
};

inline std::optional<ParsedDsf> parse_dsf_bytes(const std::vector<uint8_t> &f) {
    if (f.size() < 92 || f[0] != 'D' || f[28] != 'f' || f[80] != 'd') {
        return std::nullopt;
    }
    ParsedDsf p;
    p.declared_file_size = get_le(f, 12, 8);
    p.metadata_offset = get_le(f, 20, 8);
    p.channels = static_cast<uint32_t>(get_le(f, 52, 4));
    p.sampling_frequency = static_cast<uint32_t>(get_le(f, 56, 4));
    p.sample_count = get_le(f, 64, 8);
    p.block_size = static_cast<uint32_t>(get_le(f, 72, 4));
    p.data_chunk_size = get_le(f, 84, 8);
    if (p.channels == 0 || p.block_size == 0 || 80 + p.data_chunk_size > f.size()) {
        return std::nullopt;
    }
    const uint64_t bytes_per_channel = (p.sample_count + 7) / 8;
    p.channel_bytes.assign(p.channels, {});
    for (uint32_t c = 0; c < p.channels; ++c) {
        for (uint64_t j = 0; j < bytes_per_channel; ++j) {
            const uint64_t b = j / p.block_size;
            const uint64_t pos = 92 + (b * p.channels + c) * p.block_size + j % p.block_size;
            if (pos >= f.size()) {
                return std::nullopt;
            }
            p.channel_bytes[c].push_back(f[static_cast<size_t>(pos)]);
        }
    }
    return p;
}

// Bit `i` of a byte stream, counting from the most significant bit of byte 0.
inline int bit_at(const std::vector<uint8_t> &bytes, uint64_t i) {
    return (bytes[static_cast<size_t>(i / 8)] >> (7 - i % 8)) & 1;
}

// Bit `i` counting from the least significant bit of byte 0.
inline int bit_at_lsb(const std::vector<uint8_t> &bytes, uint64_t i) {
    return (bytes[static_cast<size_t>(i / 8)] >> (i % 8)) & 1;
}

inline std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                std::istreambuf_iterator<char>());
}

inline bool write_file(const std::filesystem::path &path, const std::vector<uint8_t> &data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    return f.good();
}

inline bool write_text(const std::filesystem::path &path, const std::string &text) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << text;
    return f.good();
}

// Fresh, empty scratch directory below `root`.
inline std::filesystem::path scratch_dir(const std::string &root, const std::string &name) {
    std::filesystem::path dir = std::filesystem::path(root) / name;
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    return dir;
}

// "MM:SS:FF" for a frame count.
inline std::string msf(uint64_t frames) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu",
                  static_cast<unsigned long long>(frames / 75 / 60),
                  static_cast<unsigned long long>(frames / 75 % 60),
                  static_cast<unsigned long long>(frames % 75));
    return buf;
}

}  // namespace test_utils
