//
//  dsdslicer.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "byte_source.hpp"
#include "dsf_reader.hpp"
#include "split_options.hpp"
#include "split_status.hpp"

namespace dsdslicer {

/// @defgroup api DsdSlicer Public API
/// Public, supported C++ interfaces for splitting DSF containers along a CUE sheet.
/// @{

/// Outcome of one track.
struct TrackResult {
    uint32_t track_number{0};
    std::string output_path;  ///< planned output path (written only when `status.ok`)
    SplitStatus status;
};

/**
 * @brief Outcome of a split run.
 *
 * `status` carries the fatal error (track list, container, boundaries, output directory) or,
 * when only individual tracks failed, the first of those failures in track order. `tracks`
 * is always in track order.
 */
struct SplitReport {
    SplitStatus status;
    std::vector<TrackResult> tracks;

    bool ok() const { return status.ok; }
};

/**
 * @brief Return the DsdSlicer library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();

/**
 * @brief Split `source` into one DSF file per track of `track_list_text`.
 *
 * @param track_list_text CUE sheet text; all of its tracks refer to `source`.
 * @param source The source DSF container. Shared read-only by all workers.
 * @param output_directory Existing directory receiving `NN - Title.dsf` files.
 * @param options Run configuration.
 */
SplitReport split(std::string_view track_list_text, const ByteSource &source,
                  const std::filesystem::path &output_directory,
                  const SplitOptions &options = {});

/// @overload Reads the track list from `track_list_path` and opens `source_path`.
SplitReport split_file(const std::string &track_list_path, const std::string &source_path,
                       const std::string &output_directory, const SplitOptions &options = {});

/**
 * @brief Split every `FILE` group of a CUE sheet.
 *
 * File names are resolved relative to the sheet's directory. An empty `output_directory`
 * means the sheet's directory.
 */
SplitReport split_cue(const std::string &cue_path, const std::string &output_directory = {},
                      const SplitOptions &options = {});

/// Parse the header of a DSF file. The returned descriptor carries no source handle.
std::optional<DsfDescriptor> inspect_dsf(const std::string &path, SplitStatus &status);

/// @}

#ifdef DSDSLICER_TESTING
/// Test hook: worker threads beyond `limit` fail to start as if the system refused them.
void set_worker_start_limit_for_test(unsigned limit);
#endif

}  // namespace dsdslicer
