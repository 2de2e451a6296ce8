//
//  cue_parser.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "cue_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>

#include "logging.hpp"

using dsdslicer::ErrorKind;
using dsdslicer::SplitStatus;

namespace {

constexpr uint32_t kStartIndexNumber = 1;
constexpr uint64_t kSecondsPerMinute = 60;
// Largest minutes field whose frame count still fits in 64 bits.
constexpr uint64_t kMaxCueMinutes =
    (UINT64_MAX / kCueFramesPerSecond - (kSecondsPerMinute - 1)) / kSecondsPerMinute;

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Split off the first whitespace-delimited word.
std::string_view next_word(std::string_view &s) {
    s = trim(s);
    size_t end = 0;
    while (end < s.size() && !std::isspace(static_cast<unsigned char>(s[end]))) {
        ++end;
    }
    std::string_view word = s.substr(0, end);
    s.remove_prefix(end);
    s = trim(s);
    return word;
}

// Quoted argument without the quotes; unquoted arguments are taken verbatim.
std::string unquote(std::string_view arg) {
    arg = trim(arg);
    if (!arg.empty() && arg.front() == '"') {
        arg.remove_prefix(1);
        const size_t close = arg.find('"');
        return std::string(close == std::string_view::npos ? arg : arg.substr(0, close));
    }
    return std::string(arg);
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view s) {
    if (s.empty()) {
        return std::nullopt;
    }
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

bool format_error(SplitStatus &status, uint32_t line, std::string msg) {
    status.fail(ErrorKind::InvalidTrackListFormat, std::move(msg));
    status.line_number = line;
    DS_LOG("error", "track list line " << line << ": " << status.message);
    return false;
}

}  // namespace

namespace cue_detail {

std::optional<uint64_t> parse_msf(std::string_view msf) {
    std::optional<uint64_t> fields[3];
    for (int i = 0; i < 3; ++i) {
        const size_t colon = msf.find(':');
        if ((i < 2) == (colon == std::string_view::npos)) {
            return std::nullopt;
        }
        fields[i] = parse_unsigned<uint64_t>(i < 2 ? msf.substr(0, colon) : msf);
        if (!fields[i]) {
            return std::nullopt;
        }
        if (i < 2) {
            msf.remove_prefix(colon + 1);
        }
    }
    const uint64_t minutes = *fields[0];
    const uint64_t seconds = *fields[1];
    const uint64_t frames = *fields[2];
    if (minutes > kMaxCueMinutes || seconds >= kSecondsPerMinute ||
        frames >= kCueFramesPerSecond) {
        return std::nullopt;
    }
    return (minutes * kSecondsPerMinute + seconds) * kCueFramesPerSecond + frames;
}

}  // namespace cue_detail

std::optional<CueSheet> parse_cue_sheet(std::string_view text, SplitStatus &status) {
    // UTF-8 BOM.
    if (text.size() >= 3 && static_cast<uint8_t>(text[0]) == 0xEF &&
        static_cast<uint8_t>(text[1]) == 0xBB && static_cast<uint8_t>(text[2]) == 0xBF) {
        text.remove_prefix(3);
    }

    CueSheet sheet;
    TrackEntry *current = nullptr;
    bool current_has_start = false;
    bool any_track = false;
    uint32_t last_number = 0;

    auto close_track = [&]() -> bool {
        if (current && !current_has_start) {
            status.fail(ErrorKind::MissingStartIndex,
                        "track " + std::to_string(current->number) + " has no INDEX 01");
            status.track_number = current->number;
            DS_LOG("error", status.message);
            return false;
        }
        current = nullptr;
        current_has_start = false;
        return true;
    };

    uint32_t line_no = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = text.size();
        }
        std::string_view line = trim(text.substr(pos, eol - pos));
        pos = eol + 1;
        ++line_no;
        if (line.empty()) {
            continue;
        }

        std::string_view rest = line;
        const std::string_view command = next_word(rest);

        if (command == "FILE") {
            if (!close_track()) {
                return std::nullopt;
            }
            std::string name = unquote(rest);
            if (!rest.empty() && rest.front() != '"') {
                std::string_view tmp = rest;
                name = std::string(next_word(tmp));
            }
            DS_LOG("cue", "FILE " << name);
            sheet.files.push_back(CueFile{name, {}});
        } else if (command == "TRACK") {
            if (!close_track()) {
                return std::nullopt;
            }
            const auto number = parse_unsigned<uint32_t>(next_word(rest));
            if (!number || *number == 0) {
                format_error(status, line_no, "invalid track number");
                return std::nullopt;
            }
            if (any_track && *number <= last_number) {
                format_error(status, line_no,
                             "track number " + std::to_string(*number) +
                                 " not ascending after " + std::to_string(last_number));
                return std::nullopt;
            }
            if (sheet.files.empty()) {
                sheet.files.push_back(CueFile{});
            }
            sheet.files.back().tracks.push_back(TrackEntry{.number = *number});
            current = &sheet.files.back().tracks.back();
            any_track = true;
            last_number = *number;
        } else if (command == "TITLE" || command == "PERFORMER") {
            const bool is_title = command == "TITLE";
            std::string value = unquote(rest);
            if (current) {
                (is_title ? current->title : current->performer) = std::move(value);
            } else if (!any_track) {
                (is_title ? sheet.title : sheet.performer) = std::move(value);
            } else {
                DS_LOG("cue", "ignoring " << command << " outside a track at line " << line_no);
            }
        } else if (command == "INDEX") {
            if (!current) {
                format_error(status, line_no, "INDEX outside of a TRACK");
                return std::nullopt;
            }
            const auto index_number = parse_unsigned<uint32_t>(next_word(rest));
            if (!index_number) {
                format_error(status, line_no, "invalid INDEX number");
                return std::nullopt;
            }
            const auto frames = cue_detail::parse_msf(next_word(rest));
            if (!frames) {
                format_error(status, line_no, "malformed INDEX timestamp, expected MM:SS:FF");
                return std::nullopt;
            }
            if (*index_number == kStartIndexNumber) {
                if (current_has_start) {
                    format_error(status, line_no,
                                 "duplicate INDEX 01 for track " + std::to_string(current->number));
                    return std::nullopt;
                }
                current->start_frames = *frames;
                current_has_start = true;
                DS_LOG("cue", "track " << current->number << " INDEX 01 frames=" << *frames
                                       << " (" << current->seconds() << "s)");
            }
        }
        // REM, CATALOG, FLAGS, ISRC, PREGAP, ... carry nothing we need.
    }

    if (!close_track()) {
        return std::nullopt;
    }
    if (!any_track) {
        format_error(status, line_no, "no TRACK entries found");
        return std::nullopt;
    }
    return sheet;
}

std::optional<std::vector<TrackEntry>> parse_track_list(std::string_view text,
                                                        SplitStatus &status) {
    auto sheet = parse_cue_sheet(text, status);
    if (!sheet) {
        return std::nullopt;
    }
    return sheet->all_tracks();
}

std::optional<std::string> load_text_file(const std::string &path, SplitStatus &status) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        status.fail(ErrorKind::IOReadError, "cannot open " + path + " (" +
                                                std::generic_category().message(errno) + ")");
        DS_LOG("error", status.message);
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << f.rdbuf();
    if (f.bad()) {
        status.fail(ErrorKind::IOReadError, "failed reading " + path);
        DS_LOG("error", status.message);
        return std::nullopt;
    }
    return oss.str();
}
