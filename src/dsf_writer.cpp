//
//  dsf_writer.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "dsf_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <functional>
#include <string>
#include <system_error>
#include <utility>

#include "dsf_chunks.hpp"
#include "logging.hpp"

using dsdslicer::ErrorKind;
using dsdslicer::SplitStatus;

namespace {

constexpr size_t kDsdFileSizeField = 12;
constexpr size_t kDsdMetaOffsetField = 20;
constexpr uint32_t kFmtReserved = 0;

#ifdef DSDSLICER_TESTING
std::function<void(const std::filesystem::path &)> g_before_publish_hook;
#endif

ChunkPtr build_dsd_chunk() {
    auto dsd = Chunk::create("DSD ");
    write_u64le(dsd->payload, 0);  // total file size, patched once the layout is final
    write_u64le(dsd->payload, 0);  // metadata offset, patched likewise
    dsd->fix_size();
    return dsd;
}

ChunkPtr build_fmt_chunk(const DsfDescriptor &source, uint64_t sample_count) {
    auto fmt = Chunk::create("fmt ");
    auto &p = fmt->payload;
    write_u32le(p, kDsfFormatVersion);
    write_u32le(p, kDsfFormatRawDsd);
    write_u32le(p, source.channel_type);
    write_u32le(p, source.channel_count);
    write_u32le(p, source.sampling_frequency);
    write_u32le(p, source.bits_per_sample);
    write_u64le(p, sample_count);
    write_u32le(p, source.block_size_per_channel);
    write_u32le(p, kFmtReserved);
    fmt->fix_size();
    return fmt;
}

// Interleave blocks in (block, channel) order; the tail of each channel's last block is zero.
void write_data_payload(std::vector<uint8_t> &out, const DsfDescriptor &source,
                        const std::vector<ExtractedChannelStream> &streams,
                        const DsfLayout &layout) {
    const uint64_t bs = source.block_size_per_channel;
    for (uint64_t blk = 0; blk < layout.block_count; ++blk) {
        const uint64_t from = blk * bs;
        for (const auto &stream : streams) {
            const uint64_t avail =
                from < stream.bytes.size() ? std::min<uint64_t>(bs, stream.bytes.size() - from) : 0;
            if (avail > 0) {
                const auto begin = stream.bytes.begin() + static_cast<std::ptrdiff_t>(from);
                out.insert(out.end(), begin, begin + static_cast<std::ptrdiff_t>(avail));
            }
            out.insert(out.end(), static_cast<size_t>(bs - avail), uint8_t{0});
        }
    }
}

}  // namespace

std::optional<DsfLayout> plan_dsf_layout(const DsfDescriptor &source,
                                         const std::vector<ExtractedChannelStream> &streams,
                                         uint64_t tag_size, SplitStatus &status) {
    if (streams.size() != source.channel_count) {
        status.fail(ErrorKind::IncompatibleChannelLengths,
                    "got " + std::to_string(streams.size()) + " channel streams for a " +
                        std::to_string(source.channel_count) + "-channel source");
        DS_LOG("error", status.message);
        return std::nullopt;
    }
    DsfLayout layout;
    layout.sample_count = streams.empty() ? 0 : streams.front().bit_length;
    layout.bytes_per_channel = (layout.sample_count + 7) / 8;
    for (const auto &s : streams) {
        if (s.bit_length != layout.sample_count || s.bytes.size() != layout.bytes_per_channel) {
            status.fail(ErrorKind::IncompatibleChannelLengths,
                        "channel " + std::to_string(s.channel) + " carries " +
                            std::to_string(s.bit_length) + " bits, expected " +
                            std::to_string(layout.sample_count));
            DS_LOG("error", status.message);
            return std::nullopt;
        }
    }
    const uint64_t bs = source.block_size_per_channel;
    layout.block_count = (layout.bytes_per_channel + bs - 1) / bs;
    layout.data_bytes = layout.block_count * bs * source.channel_count;
    const uint64_t data_end = kDataRegionOffset + layout.data_bytes;
    layout.metadata_offset = tag_size ? data_end : 0;
    layout.file_size = data_end + tag_size;
    return layout;
}

std::optional<std::vector<uint8_t>> build_dsf(const DsfDescriptor &source,
                                              const std::vector<ExtractedChannelStream> &streams,
                                              const TrackMetadata &meta, SplitStatus &status) {
    const std::vector<uint8_t> tag = build_id3_tag(meta);
    auto layout = plan_dsf_layout(source, streams, tag.size(), status);
    if (!layout) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(layout->file_size));

    auto dsd = build_dsd_chunk();
    auto fmt = build_fmt_chunk(source, layout->sample_count);
    dsd->write(out);
    fmt->write(out);
    write_chunk_header(out, fourcc("data"), kDataChunkHeaderSize + layout->data_bytes);
    write_data_payload(out, source, streams, *layout);
    out.insert(out.end(), tag.begin(), tag.end());

    // Patch DSD chunk size fields now that the layout is known.
    patch_u64le(out, kDsdFileSizeField, out.size());
    patch_u64le(out, kDsdMetaOffsetField, layout->metadata_offset);

    if (out.size() != layout->file_size) {
        status.fail(ErrorKind::IOWriteError, "serialized " + std::to_string(out.size()) +
                                                 " bytes, planned " +
                                                 std::to_string(layout->file_size));
        DS_LOG("error", status.message);
        return std::nullopt;
    }
    DS_LOG("debug", "build_dsf samples=" << layout->sample_count << " blocks="
                                         << layout->block_count << " data=" << layout->data_bytes
                                         << " tag=" << tag.size() << " file=" << out.size());
    return out;
}

bool write_output_file(const std::filesystem::path &path, const std::vector<uint8_t> &bytes,
                       bool overwrite, SplitStatus &status) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec) && !overwrite) {
        status.fail(ErrorKind::OutputExists, path.string() + " already exists");
        DS_LOG("warn", status.message);
        return false;
    }

    std::filesystem::path part = path;
    part += ".part";
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            status.fail(ErrorKind::IOWriteError,
                        "cannot open " + part.string() + " (" +
                            std::generic_category().message(errno) + ")");
            DS_LOG("error", status.message);
            return false;
        }
        out.write(reinterpret_cast<const char *>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(part, ec);
            status.fail(ErrorKind::IOWriteError, "write failed for " + part.string());
            status.byte_offset = bytes.size();
            DS_LOG("error", status.message);
            return false;
        }
    }

#ifdef DSDSLICER_TESTING
    if (g_before_publish_hook) {
        g_before_publish_hook(path);
    }
#endif

    if (!overwrite) {
        // A hard link never replaces an existing name, so a file that appeared since the
        // check above is kept.
        std::filesystem::create_hard_link(part, path, ec);
        if (!ec) {
            std::filesystem::remove(part, ec);
            DS_LOG("io", "wrote " << path.string() << " bytes=" << bytes.size());
            return true;
        }
        if (ec == std::errc::file_exists) {
            std::filesystem::remove(part, ec);
            status.fail(ErrorKind::OutputExists, path.string() + " already exists");
            DS_LOG("warn", status.message);
            return false;
        }
        DS_LOG("io", "hard link unavailable for " << path.string() << " (" << ec.message()
                                                  << "), renaming");
        if (std::filesystem::exists(path, ec)) {
            std::filesystem::remove(part, ec);
            status.fail(ErrorKind::OutputExists, path.string() + " already exists");
            DS_LOG("warn", status.message);
            return false;
        }
    }

    std::filesystem::rename(part, path, ec);
    if (ec) {
        std::filesystem::remove(part, ec);
        status.fail(ErrorKind::IOWriteError, "cannot move " + part.string() + " to " +
                                                 path.string() + " (" + ec.message() + ")");
        DS_LOG("error", status.message);
        return false;
    }
    DS_LOG("io", "wrote " << path.string() << " bytes=" << bytes.size());
    return true;
}

#ifdef DSDSLICER_TESTING
void set_before_publish_hook_for_test(std::function<void(const std::filesystem::path &)> hook) {
    g_before_publish_hook = std::move(hook);
}

std::vector<uint8_t> interleave_data_for_test(const DsfDescriptor &source,
                                              const std::vector<ExtractedChannelStream> &streams) {
    SplitStatus status;
    std::vector<uint8_t> out;
    auto layout = plan_dsf_layout(source, streams, 0, status);
    if (layout) {
        write_data_payload(out, source, streams, *layout);
    }
    return out;
}
#endif
