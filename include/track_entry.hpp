//
//  track_entry.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

inline constexpr uint32_t kCueFramesPerSecond = 75;  // redbook frames

/// @ingroup api
/// One track of a track list (CUE sheet), as declared.
struct TrackEntry {
    uint32_t number = 0;       ///< Track number (unique, ascending)
    std::string title;         ///< Optional title (UTF-8, may be empty)
    std::string performer;     ///< Optional performer (UTF-8, may be empty)
    uint64_t start_frames = 0; ///< INDEX 01 as total CD frames (MM*60*75 + SS*75 + FF)

    /// Start time in seconds: MM*60 + SS + FF/75.
    double seconds() const {
        return static_cast<double>(start_frames) / static_cast<double>(kCueFramesPerSecond);
    }
};

/// Tracks that share one source container (a `FILE` entry).
struct CueFile {
    std::string path;  ///< As written in the sheet; empty for tracks declared before any FILE
    std::vector<TrackEntry> tracks;
};

/// A whole parsed track list.
struct CueSheet {
    std::string title;      ///< Album title (TITLE before the first TRACK)
    std::string performer;  ///< Album performer (PERFORMER before the first TRACK)
    std::vector<CueFile> files;

    /// All tracks of all files, in declaration order.
    std::vector<TrackEntry> all_tracks() const {
        std::vector<TrackEntry> out;
        for (const auto &f : files) {
            out.insert(out.end(), f.tracks.begin(), f.tracks.end());
        }
        return out;
    }
};

/// A track mapped onto the source's sample axis: [start_sample, end_sample).
struct TrackBoundary {
    uint32_t track_number = 0;
    uint64_t start_sample = 0;  ///< inclusive
    uint64_t end_sample = 0;    ///< exclusive

    uint64_t sample_count() const { return end_sample - start_sample; }
};
