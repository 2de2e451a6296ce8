//
//  split_status.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dsdslicer {

/// @ingroup api
/// Failure categories reported by every stage of a split run.
enum class ErrorKind {
    None = 0,
    InvalidTrackListFormat,
    MissingStartIndex,
    NotAValidContainer,
    UnsupportedBitDepth,
    UnsupportedFormat,
    TrackBoundaryError,
    IncompatibleChannelLengths,
    OutputExists,
    IOReadError,
    IOWriteError,
    InvalidConfiguration,
    Skipped,
};

/// Stable, human-readable name of an error kind (e.g. "TrackBoundaryError").
std::string_view error_kind_name(ErrorKind kind);

/**
 * @brief Result object with success flag, error kind and context.
 *
 * When `ok == true`, `kind` is `ErrorKind::None` and `message` is empty. On failure the
 * optional context fields carry whatever locates the problem: the track number, the byte
 * offset (relative to the container start or its data region, as the message states) or the
 * 1-based line of the track list.
 */
struct SplitStatus {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string message;
    std::optional<uint32_t> track_number;
    std::optional<uint64_t> byte_offset;
    std::optional<uint32_t> line_number;

    /// Fill this status as a failure and return false, so callers can `return status.fail(...)`.
    bool fail(ErrorKind k, std::string msg);

    /// "Kind: message (track N, offset X, line L)".
    std::string describe() const;
};

inline SplitStatus make_error(ErrorKind kind, std::string message) {
    SplitStatus s;
    s.fail(kind, std::move(message));
    return s;
}

}  // namespace dsdslicer
