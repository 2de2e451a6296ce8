//
//  track_timing.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "split_status.hpp"
#include "track_entry.hpp"

// Sample index of a CUE timestamp: floor(frames * sampling_frequency / 75), exact.
// Saturates at UINT64_MAX when the result does not fit.
uint64_t frames_to_sample(uint64_t start_frames, uint32_t sampling_frequency);

// Map track starts onto [0, total_samples). Track i ends where track i+1 starts; the last track
// ends at total_samples. Fails with TrackBoundaryError (carrying the track number) when a start
// lies at or beyond total_samples, starts do not strictly increase, or the first track leaves a
// leading gap and `allow_leading_gap` is false.
std::optional<std::vector<TrackBoundary>> compute_boundaries(const std::vector<TrackEntry> &tracks,
                                                             uint32_t sampling_frequency,
                                                             uint64_t total_samples,
                                                             bool allow_leading_gap,
                                                             dsdslicer::SplitStatus &status);
