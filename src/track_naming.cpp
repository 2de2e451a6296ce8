//
//  track_naming.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "track_naming.hpp"

#include <cstdio>

namespace {

std::string two_digit(uint32_t n) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u", n);
    return buf;
}

bool is_invalid_char(unsigned char c) {
    switch (c) {
        case '/':
        case '\\':
        case ':':
        case '*':
        case '?':
        case '"':
        case '<':
        case '>':
        case '|':
            return true;
        default:
            return c < 0x20 || c == 0x7F;
    }
}

}  // namespace

std::string sanitize_filename(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        out.push_back(is_invalid_char(static_cast<unsigned char>(ch)) ? '_' : ch);
    }
    while (!out.empty() && (out.back() == '.' || out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

std::string output_filename(uint32_t track_number, std::string_view title) {
    const std::string prefix = two_digit(track_number) + " - ";
    std::string_view stem = title;
    if (stem.substr(0, prefix.size()) == prefix) {
        stem.remove_prefix(prefix.size());
    }
    std::string clean = sanitize_filename(stem);
    if (clean.empty()) {
        clean = "Track " + two_digit(track_number);
    }
    return prefix + clean + std::string(kDsfExtension);
}
