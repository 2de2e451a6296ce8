//
//  bit_extractor.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "dsf_reader.hpp"
#include "split_status.hpp"
#include "track_entry.hpp"

/// Numbering of samples inside a byte.
enum class BitOrder {
    MsbFirst,  ///< sample 0 of a byte is its most significant bit
    LsbFirst,  ///< sample 0 of a byte is its least significant bit (DSF file convention)
};

/// Where one sample of one channel lives inside the data region.
struct SampleAddress {
    uint64_t block_index = 0;          ///< s / (block_size * 8)
    uint64_t bit_offset_in_block = 0;  ///< s mod (block_size * 8)
    uint64_t byte_address = 0;         ///< relative to the data region start
    uint32_t bit_in_byte = 0;          ///< 0 = first sample of the byte
};

/// A channel's bit range in its own (deinterleaved) bit address space.
struct BitRange {
    uint32_t channel = 0;
    uint64_t start_bit = 0;
    uint64_t bit_length = 0;
};

/// Exactly `bit_length` bits, realigned to bit 0 of byte 0; unused tail bits are zero.
struct ExtractedChannelStream {
    uint32_t channel = 0;
    uint64_t bit_length = 0;
    std::vector<uint8_t> bytes;  ///< ceil(bit_length / 8) bytes
};

// Address of sample `sample` of channel `channel` under the interleaved block layout.
SampleAddress map_sample(const DsfDescriptor &desc, uint32_t channel, uint64_t sample);

// Shift-merge `src` (whose first relevant bit sits at position k of byte 0) into
// ceil(bit_length/8) bytes at `out`. `src_len` bytes are available; missing bytes read as zero.
void shift_merge(const uint8_t *src, size_t src_len, unsigned k, uint64_t bit_length,
                 BitOrder order, uint8_t *out);

// Extract one channel's bits. Fails with TrackBoundaryError when any source byte lies outside
// the data region, IOReadError when the source read fails.
std::optional<ExtractedChannelStream> extract_channel_bits(const DsfDescriptor &desc,
                                                           const BitRange &range, BitOrder order,
                                                           dsdslicer::SplitStatus &status);

// Extract every channel of a track's [start_sample, end_sample).
std::optional<std::vector<ExtractedChannelStream>> extract_track(const DsfDescriptor &desc,
                                                                 const TrackBoundary &boundary,
                                                                 BitOrder order,
                                                                 dsdslicer::SplitStatus &status);
