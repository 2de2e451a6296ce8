//
//  cue_parser.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "split_status.hpp"
#include "track_entry.hpp"

// Parse CUE sheet text. On failure returns nullopt and fills `status` with
// InvalidTrackListFormat (carrying the line) or MissingStartIndex (carrying the track).
std::optional<CueSheet> parse_cue_sheet(std::string_view text, dsdslicer::SplitStatus &status);

// Flattened, ordered track sequence of a CUE sheet.
std::optional<std::vector<TrackEntry>> parse_track_list(std::string_view text,
                                                        dsdslicer::SplitStatus &status);

// Read a track-list file into memory (IOReadError on failure).
std::optional<std::string> load_text_file(const std::string &path, dsdslicer::SplitStatus &status);

namespace cue_detail {
// Parse "MM:SS:FF" into total frames; nullopt when malformed or out of range.
std::optional<uint64_t> parse_msf(std::string_view msf);
}  // namespace cue_detail
