//
//  id3_builder.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "id3_builder.hpp"

#include "dsf_chunks.hpp"
#include "logging.hpp"

// ID3v2.4 tag structure:
//
// "ID3" v4.0 flags(0) size(syncsafe, frames only)
//   [<frame id>] size(syncsafe) flags(0)
//      encoding (3 = UTF-8)
//      <text>

namespace {

constexpr uint8_t kId3MajorVersion = 4;
constexpr uint8_t kId3Revision = 0;
constexpr uint8_t kTextEncodingUtf8 = 3;
constexpr uint32_t kSyncsafeMax = 0x0FFFFFFF;

}  // namespace

void write_syncsafe(std::vector<uint8_t> &out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 21) & 0x7F));
    out.push_back(static_cast<uint8_t>((value >> 14) & 0x7F));
    out.push_back(static_cast<uint8_t>((value >> 7) & 0x7F));
    out.push_back(static_cast<uint8_t>(value & 0x7F));
}

std::vector<uint8_t> build_text_frame(const char id[4], const std::string &text) {
    std::vector<uint8_t> frame;
    const uint32_t body_size = static_cast<uint32_t>(1 + text.size());

    // frame header.
    write_fourcc(frame, fourcc(id));
    write_syncsafe(frame, body_size);
    write_u16(frame, 0);  // flags

    // body.
    write_u8(frame, kTextEncodingUtf8);
    frame.insert(frame.end(), text.begin(), text.end());
    return frame;
}

std::vector<uint8_t> build_id3_tag(const TrackMetadata &meta) {
    std::vector<uint8_t> frames;
    auto add = [&](const char id[4], const std::string &value) {
        if (value.empty()) {
            return;
        }
        auto f = build_text_frame(id, value);
        frames.insert(frames.end(), f.begin(), f.end());
    };
    add("TIT2", meta.title);
    add("TPE1", meta.performer);
    add("TALB", meta.album);
    if (meta.track_number != 0) {
        std::string trck = std::to_string(meta.track_number);
        if (meta.track_total != 0) {
            trck += "/" + std::to_string(meta.track_total);
        }
        add("TRCK", trck);
    }
    if (frames.empty()) {
        return {};
    }
    if (frames.size() > kSyncsafeMax) {
        DS_LOG("warn", "ID3 frames too large (" << frames.size() << " bytes); tag dropped");
        return {};
    }

    std::vector<uint8_t> tag;
    tag.reserve(10 + frames.size());
    tag.insert(tag.end(), {'I', 'D', '3'});
    write_u8(tag, kId3MajorVersion);
    write_u8(tag, kId3Revision);
    write_u8(tag, 0);  // flags
    write_syncsafe(tag, static_cast<uint32_t>(frames.size()));
    tag.insert(tag.end(), frames.begin(), frames.end());
    DS_LOG("debug", "id3 tag bytes=" << tag.size() << " title='" << meta.title
                                     << "' performer='" << meta.performer << "'");
    return tag;
}
