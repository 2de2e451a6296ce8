//
//  dsf_reader.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "byte_source.hpp"
#include "split_status.hpp"

/**
 * @brief Parsed DSF header plus a read-only handle to the interleaved data region.
 *
 * The descriptor owns the header fields. `source` is borrowed: it must outlive every
 * extraction that uses the descriptor and is shared, read-only, by all tracks of a run.
 */
struct DsfDescriptor {
    uint32_t format_version = 0;
    uint32_t format_id = 0;
    uint32_t channel_type = 0;            ///< DSF channel arrangement id (2 = stereo, ...)
    uint32_t channel_count = 0;           ///< >= 1
    uint32_t sampling_frequency = 0;      ///< Hz, > 0
    uint32_t bits_per_sample = 0;         ///< always 1 once accepted
    uint64_t sample_count = 0;            ///< samples per channel
    uint32_t block_size_per_channel = 0;  ///< bytes per channel per interleave block

    uint64_t file_size = 0;        ///< bytes available in the source
    uint64_t declared_file_size = 0;  ///< total size written in the DSD chunk
    uint64_t data_offset = 0;      ///< absolute offset of the first data byte
    uint64_t data_size = 0;        ///< bytes in the data region (chunk size - 12)
    uint64_t metadata_offset = 0;  ///< absolute offset of the ID3v2 tag, 0 when absent
    uint64_t metadata_size = 0;

    const dsdslicer::ByteSource *source = nullptr;

    /// Number of complete interleave blocks (all channels) held by the data region.
    uint64_t block_count() const {
        const uint64_t stride = uint64_t(block_size_per_channel) * channel_count;
        return stride ? data_size / stride : 0;
    }

    /// Read `len` bytes at `offset` relative to the start of the data region.
    bool read_data(uint64_t offset, uint8_t *dst, size_t len) const;
};

// Parse the DSD/fmt/data chunk headers of `source`.
// Fails with NotAValidContainer, UnsupportedFormat, UnsupportedBitDepth or IOReadError.
std::optional<DsfDescriptor> parse_dsf(const dsdslicer::ByteSource &source,
                                       dsdslicer::SplitStatus &status);

// Raw bytes of the trailing metadata (ID3v2) region; empty when absent or unreadable.
std::vector<uint8_t> read_dsf_metadata(const DsfDescriptor &desc);
