//
//  dsf_writer.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

#include "bit_extractor.hpp"
#include "dsf_reader.hpp"
#include "id3_builder.hpp"
#include "split_status.hpp"

// Sizes of an output container, derived before anything is serialized.
struct DsfLayout {
    uint64_t sample_count = 0;       ///< bit length of every channel stream
    uint64_t bytes_per_channel = 0;  ///< ceil(sample_count / 8)
    uint64_t block_count = 0;        ///< blocks per channel after zero padding
    uint64_t data_bytes = 0;         ///< block_count * block_size * channel_count
    uint64_t metadata_offset = 0;    ///< 0 when no tag is appended
    uint64_t file_size = 0;
};

// Compute the layout for `streams` (one per channel, all of equal bit length).
// Fails with IncompatibleChannelLengths when the streams disagree with each other or the source.
std::optional<DsfLayout> plan_dsf_layout(const DsfDescriptor &source,
                                         const std::vector<ExtractedChannelStream> &streams,
                                         uint64_t tag_size, dsdslicer::SplitStatus &status);

// Re-block, interleave and serialize a complete DSF container for one track.
// `meta` is embedded as an ID3v2 tag unless it is empty.
std::optional<std::vector<uint8_t>> build_dsf(const DsfDescriptor &source,
                                              const std::vector<ExtractedChannelStream> &streams,
                                              const TrackMetadata &meta,
                                              dsdslicer::SplitStatus &status);

// Write `bytes` to `path` through a temporary sibling file that is moved into place.
// Without `overwrite` the file is published by hard link, so a file that appears at `path`
// meanwhile is never replaced. Fails with OutputExists or IOWriteError.
bool write_output_file(const std::filesystem::path &path, const std::vector<uint8_t> &bytes,
                       bool overwrite, dsdslicer::SplitStatus &status);

#ifdef DSDSLICER_TESTING
// Test hook: called with the target path after the temporary file is complete, before it
// is published. An empty function removes the hook.
void set_before_publish_hook_for_test(std::function<void(const std::filesystem::path &)> hook);

// Test hook: the interleaved, zero-padded data region build_dsf would emit for `streams`.
std::vector<uint8_t> interleave_data_for_test(const DsfDescriptor &source,
                                              const std::vector<ExtractedChannelStream> &streams);
#endif
