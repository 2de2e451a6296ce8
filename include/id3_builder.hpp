//
//  id3_builder.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Minimal per-track tags carried into an output container.
 *
 * Fields are UTF-8; empty fields are omitted from the tag.
 */
struct TrackMetadata {
    std::string title;        ///< TIT2
    std::string performer;    ///< TPE1
    std::string album;        ///< TALB
    uint32_t track_number = 0;  ///< TRCK (omitted when 0)
    uint32_t track_total = 0;   ///< TRCK "n/total" when non-zero

    bool empty() const {
        return title.empty() && performer.empty() && album.empty() && track_number == 0;
    }
};

// Encode a 28-bit value as a 4-byte ID3v2 syncsafe integer.
void write_syncsafe(std::vector<uint8_t> &out, uint32_t value);

// One UTF-8 text frame (v2.4 layout).
std::vector<uint8_t> build_text_frame(const char id[4], const std::string &text);

// A complete ID3v2.4 tag for `meta`; empty when `meta` has nothing to say.
std::vector<uint8_t> build_id3_tag(const TrackMetadata &meta);
