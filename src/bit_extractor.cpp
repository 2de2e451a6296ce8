//
//  bit_extractor.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "bit_extractor.hpp"

#include <algorithm>
#include <string>

#include "logging.hpp"

using dsdslicer::ErrorKind;
using dsdslicer::hex_prefix;
using dsdslicer::SplitStatus;

namespace {

constexpr uint64_t kBitsPerByte = 8;

// Physical offset (relative to the data region) of logical byte `j` of `channel`.
uint64_t physical_offset(const DsfDescriptor &desc, uint32_t channel, uint64_t j) {
    const uint64_t bs = desc.block_size_per_channel;
    const uint64_t block = j / bs;
    return (block * desc.channel_count + channel) * bs + (j % bs);
}

// Copy logical bytes [first, first + count) of `channel` into `dst`, one read per block piece.
bool gather_channel_bytes(const DsfDescriptor &desc, uint32_t channel, uint64_t first,
                          uint64_t count, uint8_t *dst, SplitStatus &status) {
    const uint64_t bs = desc.block_size_per_channel;
    uint64_t j = first;
    const uint64_t end = first + count;
    while (j < end) {
        const uint64_t in_block = j % bs;
        const uint64_t run = std::min<uint64_t>(bs - in_block, end - j);
        const uint64_t phys = physical_offset(desc, channel, j);
        if (phys > desc.data_size || run > desc.data_size - phys) {
            status.fail(ErrorKind::TrackBoundaryError,
                        "channel " + std::to_string(channel) + " byte " + std::to_string(j) +
                            " maps past the data region (" + std::to_string(desc.data_size) +
                            " bytes)");
            status.byte_offset = desc.data_offset + phys;
            DS_LOG("extract", status.message << " abs=" << desc.data_offset + phys);
            return false;
        }
        if (!desc.read_data(phys, dst + (j - first), static_cast<size_t>(run))) {
            status.fail(ErrorKind::IOReadError, "failed to read " + std::to_string(run) +
                                                    " bytes of channel " +
                                                    std::to_string(channel));
            status.byte_offset = desc.data_offset + phys;
            DS_LOG("extract", status.message << " abs=" << desc.data_offset + phys);
            return false;
        }
        j += run;
    }
    return true;
}

}  // namespace

SampleAddress map_sample(const DsfDescriptor &desc, uint32_t channel, uint64_t sample) {
    const uint64_t bits_per_block = uint64_t(desc.block_size_per_channel) * kBitsPerByte;
    SampleAddress a;
    a.block_index = sample / bits_per_block;
    a.bit_offset_in_block = sample % bits_per_block;
    a.byte_address = (a.block_index * desc.channel_count + channel) * desc.block_size_per_channel +
                     a.bit_offset_in_block / kBitsPerByte;
    a.bit_in_byte = static_cast<uint32_t>(a.bit_offset_in_block % kBitsPerByte);
    return a;
}

void shift_merge(const uint8_t *src, size_t src_len, unsigned k, uint64_t bit_length,
                 BitOrder order, uint8_t *out) {
    const size_t out_len = static_cast<size_t>((bit_length + kBitsPerByte - 1) / kBitsPerByte);
    if (out_len == 0) {
        return;
    }
    if (k == 0) {
        std::copy(src, src + std::min(out_len, src_len), out);
        std::fill(out + std::min(out_len, src_len), out + out_len, 0);
    } else {
        for (size_t i = 0; i < out_len; ++i) {
            const unsigned cur = i < src_len ? src[i] : 0;
            const unsigned next = i + 1 < src_len ? src[i + 1] : 0;
            if (order == BitOrder::MsbFirst) {
                out[i] = static_cast<uint8_t>((cur << k) | (next >> (kBitsPerByte - k)));
            } else {
                out[i] = static_cast<uint8_t>((cur >> k) | (next << (kBitsPerByte - k)));
            }
        }
    }
    // Zero the unused tail of the final byte.
    const unsigned used = static_cast<unsigned>(bit_length % kBitsPerByte);
    if (used != 0) {
        const uint8_t mask = order == BitOrder::MsbFirst
                                 ? static_cast<uint8_t>(0xFF << (kBitsPerByte - used))
                                 : static_cast<uint8_t>((1u << used) - 1);
        out[out_len - 1] &= mask;
    }
}

std::optional<ExtractedChannelStream> extract_channel_bits(const DsfDescriptor &desc,
                                                           const BitRange &range, BitOrder order,
                                                           SplitStatus &status) {
    ExtractedChannelStream stream;
    stream.channel = range.channel;
    stream.bit_length = range.bit_length;
    if (range.bit_length == 0) {
        return stream;
    }
    if (range.channel >= desc.channel_count) {
        status.fail(ErrorKind::TrackBoundaryError,
                    "channel " + std::to_string(range.channel) + " out of range");
        return std::nullopt;
    }

    const uint64_t first = range.start_bit / kBitsPerByte;
    const uint64_t last = (range.start_bit + range.bit_length - 1) / kBitsPerByte;
    const unsigned k = static_cast<unsigned>(range.start_bit % kBitsPerByte);

    std::vector<uint8_t> src(static_cast<size_t>(last - first + 1));
    if (!gather_channel_bytes(desc, range.channel, first, src.size(), src.data(), status)) {
        return std::nullopt;
    }

    stream.bytes.resize(static_cast<size_t>((range.bit_length + kBitsPerByte - 1) / kBitsPerByte));
    shift_merge(src.data(), src.size(), k, range.bit_length, order, stream.bytes.data());

    DS_LOG("extract", "channel " << range.channel << " bits [" << range.start_bit << ", +"
                                 << range.bit_length << ") k=" << k << " src_bytes=" << src.size()
                                 << " out_bytes=" << stream.bytes.size()
                                 << " head=" << hex_prefix(stream.bytes));
    return stream;
}

std::optional<std::vector<ExtractedChannelStream>> extract_track(const DsfDescriptor &desc,
                                                                 const TrackBoundary &boundary,
                                                                 BitOrder order,
                                                                 SplitStatus &status) {
    if (boundary.end_sample < boundary.start_sample ||
        boundary.end_sample > desc.sample_count) {
        status.fail(ErrorKind::TrackBoundaryError,
                    "range [" + std::to_string(boundary.start_sample) + ", " +
                        std::to_string(boundary.end_sample) + ") exceeds source sample count " +
                        std::to_string(desc.sample_count));
        status.track_number = boundary.track_number;
        return std::nullopt;
    }

    std::vector<ExtractedChannelStream> streams;
    streams.reserve(desc.channel_count);
    for (uint32_t c = 0; c < desc.channel_count; ++c) {
        BitRange range{.channel = c,
                       .start_bit = boundary.start_sample,
                       .bit_length = boundary.sample_count()};
        auto stream = extract_channel_bits(desc, range, order, status);
        if (!stream) {
            status.track_number = boundary.track_number;
            return std::nullopt;
        }
        streams.push_back(std::move(*stream));
    }
    return streams;
}
