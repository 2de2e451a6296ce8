//
//  split_options.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "bit_extractor.hpp"
#include "split_status.hpp"

namespace dsdslicer {

/// @ingroup api
/// Run configuration, passed explicitly to every split entry point.
struct SplitOptions {
    bool overwrite_existing{false};  ///< replace existing outputs instead of failing
    bool fail_fast{true};            ///< stop starting new tracks after the first failure
    unsigned jobs{1};                ///< worker threads; 0 = hardware concurrency
    bool embed_metadata{true};       ///< append an ID3v2 tag to each output
    bool allow_leading_gap{false};   ///< accept a first track starting after sample 0
    BitOrder bit_order{BitOrder::MsbFirst};
};

/// Number of worker threads `options` resolves to for `track_count` tracks (at least 1).
unsigned effective_jobs(const SplitOptions &options, size_t track_count);

/**
 * @brief Parse options from JSON text, starting from `base`.
 *
 * Recognised keys: `overwrite`, `fail_fast`, `jobs`, `embed_metadata`, `allow_leading_gap`
 * (booleans / unsigned) and `bit_order` (`"msb"` or `"lsb"`). Unknown keys are ignored.
 * Malformed JSON or a wrongly typed value fails with InvalidConfiguration.
 */
std::optional<SplitOptions> parse_split_options_json(std::string_view text, SplitStatus &status,
                                                     const SplitOptions &base = {});

/// Load and parse an options file (IOReadError when it cannot be read).
std::optional<SplitOptions> load_split_options_json(const std::string &path, SplitStatus &status,
                                                    const SplitOptions &base = {});

}  // namespace dsdslicer
