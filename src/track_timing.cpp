//
//  track_timing.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "track_timing.hpp"

#include <cstdint>
#include <string>

#include "logging.hpp"

using dsdslicer::ErrorKind;
using dsdslicer::SplitStatus;

uint64_t frames_to_sample(uint64_t start_frames, uint32_t sampling_frequency) {
    // Split to keep frames * fs inside 64 bits for any realistic sheet length.
    const uint64_t whole_seconds = start_frames / kCueFramesPerSecond;
    const uint64_t rest_frames = start_frames % kCueFramesPerSecond;
    // Saturate instead of wrapping; such a start lies beyond any source.
    if (sampling_frequency != 0 && whole_seconds > UINT64_MAX / sampling_frequency - 1) {
        return UINT64_MAX;
    }
    return whole_seconds * sampling_frequency +
           (rest_frames * sampling_frequency) / kCueFramesPerSecond;
}

std::optional<std::vector<TrackBoundary>> compute_boundaries(const std::vector<TrackEntry> &tracks,
                                                             uint32_t sampling_frequency,
                                                             uint64_t total_samples,
                                                             bool allow_leading_gap,
                                                             SplitStatus &status) {
    auto reject = [&](uint32_t track, std::string msg) {
        status.fail(ErrorKind::TrackBoundaryError, std::move(msg));
        status.track_number = track;
        DS_LOG("error", "track " << track << ": " << status.message);
        return std::nullopt;
    };

    std::vector<TrackBoundary> out;
    out.reserve(tracks.size());
    if (tracks.empty()) {
        return out;
    }

    for (size_t i = 0; i < tracks.size(); ++i) {
        const auto &t = tracks[i];
        const uint64_t start = frames_to_sample(t.start_frames, sampling_frequency);
        if (start >= total_samples) {
            return reject(t.number, "start sample " + std::to_string(start) +
                                        " at or beyond source sample count " +
                                        std::to_string(total_samples));
        }
        if (i == 0 && start != 0) {
            if (!allow_leading_gap) {
                return reject(t.number, "first track starts at sample " + std::to_string(start) +
                                            "; samples before it would be lost");
            }
            DS_LOG("warn", "dropping " << start << " leading samples before track " << t.number);
        }
        if (!out.empty()) {
            if (start <= out.back().start_sample) {
                return reject(t.number, "start sample " + std::to_string(start) +
                                            " does not follow track " +
                                            std::to_string(out.back().track_number) + " at " +
                                            std::to_string(out.back().start_sample));
            }
            out.back().end_sample = start;
        }
        out.push_back(TrackBoundary{.track_number = t.number, .start_sample = start});
    }
    out.back().end_sample = total_samples;

    for (const auto &b : out) {
        DS_LOG("debug", "boundary track " << b.track_number << " [" << b.start_sample << ", "
                                          << b.end_sample << ") samples=" << b.sample_count());
    }
    return out;
}
