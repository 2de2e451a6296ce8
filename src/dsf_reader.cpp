//
//  dsf_reader.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "dsf_reader.hpp"

#include <array>

#include "dsf_chunks.hpp"
#include "logging.hpp"

using dsdslicer::ByteSource;
using dsdslicer::ErrorKind;
using dsdslicer::SplitStatus;

namespace {

// Offsets inside the fixed 92-byte header.
constexpr size_t kDsdSizeOffset = 4;
constexpr size_t kDsdFileSizeOffset = 12;
constexpr size_t kDsdMetaOffset = 20;
constexpr size_t kFmtOffset = kDsdChunkSize;
constexpr size_t kFmtSizeOffset = kFmtOffset + 4;
constexpr size_t kFmtVersionOffset = kFmtOffset + 12;
constexpr size_t kFmtIdOffset = kFmtOffset + 16;
constexpr size_t kFmtChannelTypeOffset = kFmtOffset + 20;
constexpr size_t kFmtChannelNumOffset = kFmtOffset + 24;
constexpr size_t kFmtSampleRateOffset = kFmtOffset + 28;
constexpr size_t kFmtBitsOffset = kFmtOffset + 32;
constexpr size_t kFmtSampleCountOffset = kFmtOffset + 36;
constexpr size_t kFmtBlockSizeOffset = kFmtOffset + 44;
constexpr size_t kDataOffset = kDsdChunkSize + kFmtChunkSize;
constexpr size_t kDataSizeOffset = kDataOffset + 4;

bool invalid(SplitStatus &status, uint64_t offset, std::string msg) {
    status.fail(ErrorKind::NotAValidContainer, std::move(msg));
    status.byte_offset = offset;
    DS_LOG("error", "parse_dsf: " << status.message << " @" << offset);
    return false;
}

}  // namespace

bool DsfDescriptor::read_data(uint64_t offset, uint8_t *dst, size_t len) const {
    if (!source || offset > data_size || len > data_size - offset) {
        return false;
    }
    return source->read_at(data_offset + offset, dst, len);
}

std::optional<DsfDescriptor> parse_dsf(const ByteSource &source, SplitStatus &status) {
    const uint64_t file_size = source.size();
    DS_LOG("dsf", "parse_dsf enter size=" << file_size);
    if (file_size < kDataRegionOffset) {
        invalid(status, 0, "source too small for DSF header (" + std::to_string(file_size) +
                               " bytes)");
        return std::nullopt;
    }

    std::array<uint8_t, kDataRegionOffset> h{};
    if (!source.read_at(0, h.data(), h.size())) {
        status.fail(ErrorKind::IOReadError, "failed to read DSF header");
        status.byte_offset = 0;
        DS_LOG("error", "parse_dsf: " << status.message);
        return std::nullopt;
    }

    if (fourcc(h.data()) != fourcc("DSD ")) {
        invalid(status, 0, "missing 'DSD ' magic, found '" + fourcc_to_string(fourcc(h.data())) +
                               "'");
        return std::nullopt;
    }
    if (read_u64le(h.data() + kDsdSizeOffset) != kDsdChunkSize) {
        invalid(status, kDsdSizeOffset, "invalid DSD chunk size");
        return std::nullopt;
    }
    if (fourcc(h.data() + kFmtOffset) != fourcc("fmt ")) {
        invalid(status, kFmtOffset, "missing 'fmt ' chunk");
        return std::nullopt;
    }
    if (read_u64le(h.data() + kFmtSizeOffset) != kFmtChunkSize) {
        invalid(status, kFmtSizeOffset, "invalid fmt chunk size");
        return std::nullopt;
    }

    DsfDescriptor d;
    d.source = &source;
    d.file_size = file_size;
    d.declared_file_size = read_u64le(h.data() + kDsdFileSizeOffset);
    d.metadata_offset = read_u64le(h.data() + kDsdMetaOffset);
    d.format_version = read_u32le(h.data() + kFmtVersionOffset);
    d.format_id = read_u32le(h.data() + kFmtIdOffset);
    d.channel_type = read_u32le(h.data() + kFmtChannelTypeOffset);
    d.channel_count = read_u32le(h.data() + kFmtChannelNumOffset);
    d.sampling_frequency = read_u32le(h.data() + kFmtSampleRateOffset);
    d.bits_per_sample = read_u32le(h.data() + kFmtBitsOffset);
    d.sample_count = read_u64le(h.data() + kFmtSampleCountOffset);
    d.block_size_per_channel = read_u32le(h.data() + kFmtBlockSizeOffset);

    if (d.format_version != kDsfFormatVersion) {
        DS_LOG("warn", "DSF format version " << d.format_version << " (expected "
                                             << kDsfFormatVersion << "), continuing");
    }
    if (d.format_id != kDsfFormatRawDsd) {
        status.fail(ErrorKind::UnsupportedFormat,
                    "format id " + std::to_string(d.format_id) +
                        " not supported (only raw DSD, no DST compression)");
        status.byte_offset = kFmtIdOffset;
        DS_LOG("error", "parse_dsf: " << status.message);
        return std::nullopt;
    }
    if (d.channel_count == 0) {
        invalid(status, kFmtChannelNumOffset, "channel count is zero");
        return std::nullopt;
    }
    if (d.sampling_frequency == 0) {
        invalid(status, kFmtSampleRateOffset, "sampling frequency is zero");
        return std::nullopt;
    }
    if (d.bits_per_sample != 1) {
        status.fail(ErrorKind::UnsupportedBitDepth,
                    "bits per sample " + std::to_string(d.bits_per_sample) +
                        " not supported (only 1-bit DSD)");
        status.byte_offset = kFmtBitsOffset;
        DS_LOG("error", "parse_dsf: " << status.message);
        return std::nullopt;
    }
    if (d.block_size_per_channel == 0) {
        invalid(status, kFmtBlockSizeOffset, "block size per channel is zero");
        return std::nullopt;
    }

    if (fourcc(h.data() + kDataOffset) != fourcc("data")) {
        invalid(status, kDataOffset,
                "missing 'data' chunk, found '" +
                    fourcc_to_string(fourcc(h.data() + kDataOffset)) + "'");
        return std::nullopt;
    }
    const uint64_t data_chunk_size = read_u64le(h.data() + kDataSizeOffset);
    if (data_chunk_size < kDataChunkHeaderSize) {
        invalid(status, kDataSizeOffset, "data chunk size smaller than its header");
        return std::nullopt;
    }
    d.data_offset = kDataRegionOffset;
    d.data_size = data_chunk_size - kDataChunkHeaderSize;
    if (d.data_size > file_size - d.data_offset) {
        invalid(status, kDataSizeOffset,
                "data chunk claims " + std::to_string(d.data_size) + " bytes but only " +
                    std::to_string(file_size - d.data_offset) + " follow");
        return std::nullopt;
    }

    if (d.metadata_offset != 0) {
        const uint64_t data_end = d.data_offset + d.data_size;
        if (d.metadata_offset < data_end || d.metadata_offset >= file_size) {
            invalid(status, kDsdMetaOffset,
                    "metadata offset " + std::to_string(d.metadata_offset) +
                        " outside the trailing region");
            return std::nullopt;
        }
        d.metadata_size = file_size - d.metadata_offset;
    }
    if (d.declared_file_size != file_size) {
        DS_LOG("warn", "DSD chunk declares file size " << d.declared_file_size << " but source has "
                                                       << file_size << " bytes");
    }
    if (d.data_size % (uint64_t(d.block_size_per_channel) * d.channel_count) != 0) {
        DS_LOG("warn", "data region " << d.data_size << " bytes is not a whole number of "
                                      << d.channel_count << "x" << d.block_size_per_channel
                                      << " blocks");
    }

    DS_LOG("dsf", "parse_dsf done channels=" << d.channel_count << " type=" << d.channel_type
                                             << " fs=" << d.sampling_frequency
                                             << " samples=" << d.sample_count
                                             << " block=" << d.block_size_per_channel
                                             << " data@" << d.data_offset << "+" << d.data_size
                                             << " meta@" << d.metadata_offset);
    return d;
}

std::vector<uint8_t> read_dsf_metadata(const DsfDescriptor &desc) {
    std::vector<uint8_t> out;
    if (!desc.source || desc.metadata_offset == 0 || desc.metadata_size == 0) {
        return out;
    }
    out.resize(static_cast<size_t>(desc.metadata_size));
    if (!desc.source->read_at(desc.metadata_offset, out.data(), out.size())) {
        DS_LOG("warn", "failed to read metadata @" << desc.metadata_offset);
        out.clear();
    }
    return out;
}
