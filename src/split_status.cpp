//
//  split_status.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "split_status.hpp"

#include <sstream>

namespace dsdslicer {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::InvalidTrackListFormat:
            return "InvalidTrackListFormat";
        case ErrorKind::MissingStartIndex:
            return "MissingStartIndex";
        case ErrorKind::NotAValidContainer:
            return "NotAValidContainer";
        case ErrorKind::UnsupportedBitDepth:
            return "UnsupportedBitDepth";
        case ErrorKind::UnsupportedFormat:
            return "UnsupportedFormat";
        case ErrorKind::TrackBoundaryError:
            return "TrackBoundaryError";
        case ErrorKind::IncompatibleChannelLengths:
            return "IncompatibleChannelLengths";
        case ErrorKind::OutputExists:
            return "OutputExists";
        case ErrorKind::IOReadError:
            return "IOReadError";
        case ErrorKind::IOWriteError:
            return "IOWriteError";
        case ErrorKind::InvalidConfiguration:
            return "InvalidConfiguration";
        case ErrorKind::Skipped:
            return "Skipped";
    }
    return "Unknown";
}

bool SplitStatus::fail(ErrorKind k, std::string msg) {
    ok = false;
    kind = k;
    message = std::move(msg);
    return false;
}

std::string SplitStatus::describe() const {
    if (ok) {
        return "ok";
    }
    std::ostringstream oss;
    oss << error_kind_name(kind) << ": " << message;
    bool open = false;
    auto sep = [&]() {
        oss << (open ? ", " : " (");
        open = true;
    };
    if (track_number) {
        sep();
        oss << "track " << *track_number;
    }
    if (byte_offset) {
        sep();
        oss << "offset " << *byte_offset;
    }
    if (line_number) {
        sep();
        oss << "line " << *line_number;
    }
    if (open) {
        oss << ")";
    }
    return oss.str();
}

}  // namespace dsdslicer
