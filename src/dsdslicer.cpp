//
//  dsdslicer.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "dsdslicer.hpp"
#include "dsdslicer_version.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

#include "bit_extractor.hpp"
#include "cue_parser.hpp"
#include "dsf_writer.hpp"
#include "id3_builder.hpp"
#include "logging.hpp"
#include "track_naming.hpp"
#include "track_timing.hpp"

namespace dsdslicer {

std::string version_string() { return DSDSLICER_VERSION_DISPLAY; }

}  // namespace dsdslicer

using dsdslicer::ByteSource;
using dsdslicer::ErrorKind;
using dsdslicer::SplitOptions;
using dsdslicer::SplitReport;
using dsdslicer::SplitStatus;
using dsdslicer::TrackResult;

namespace {

// Album-level fields shared by every track of a sheet.
struct AlbumInfo {
    std::string title;
    std::string performer;
    uint32_t track_total = 0;
};

AlbumInfo album_info(const CueSheet &sheet) {
    AlbumInfo a;
    a.title = sheet.title;
    a.performer = sheet.performer;
    a.track_total = static_cast<uint32_t>(sheet.all_tracks().size());
    return a;
}

bool check_output_directory(const std::filesystem::path &dir, SplitStatus &status) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        status.fail(ErrorKind::IOWriteError,
                    "output directory " + dir.string() + " does not exist");
        DS_LOG("error", status.message);
        return false;
    }
    return true;
}

TrackResult planned_result(const TrackEntry &entry, const std::filesystem::path &out_dir) {
    TrackResult r;
    r.track_number = entry.number;
    r.output_path = (out_dir / output_filename(entry.number, entry.title)).string();
    return r;
}

TrackResult skipped_result(const TrackEntry &entry, const std::filesystem::path &out_dir) {
    TrackResult r = planned_result(entry, out_dir);
    r.status.fail(ErrorKind::Skipped, "not attempted after an earlier failure");
    r.status.track_number = entry.number;
    return r;
}

TrackMetadata track_metadata(const TrackEntry &entry, const AlbumInfo &album) {
    TrackMetadata meta;
    meta.title = entry.title;
    meta.performer = entry.performer.empty() ? album.performer : entry.performer;
    meta.album = album.title;
    meta.track_number = entry.number;
    meta.track_total = album.track_total;
    return meta;
}

// Extract, serialize and write one track. Never touches other tracks' state.
TrackResult process_track(const DsfDescriptor &desc, const TrackEntry &entry,
                          const TrackBoundary &boundary, const AlbumInfo &album,
                          const std::filesystem::path &out_dir, const SplitOptions &options) {
    TrackResult r = planned_result(entry, out_dir);
    auto &status = r.status;
    const std::filesystem::path path(r.output_path);

    std::error_code ec;
    if (!options.overwrite_existing && std::filesystem::exists(path, ec)) {
        status.fail(ErrorKind::OutputExists, r.output_path + " already exists");
        status.track_number = entry.number;
        DS_LOG("warn", "track " << entry.number << ": " << status.message);
        return r;
    }

    auto streams = extract_track(desc, boundary, options.bit_order, status);
    if (!streams) {
        status.track_number = entry.number;
        return r;
    }
    const TrackMetadata meta =
        options.embed_metadata ? track_metadata(entry, album) : TrackMetadata{};
    auto bytes = build_dsf(desc, *streams, meta, status);
    if (!bytes) {
        status.track_number = entry.number;
        return r;
    }
    if (!write_output_file(path, *bytes, options.overwrite_existing, status)) {
        status.track_number = entry.number;
        return r;
    }
    DS_LOG("info", "track " << entry.number << " [" << boundary.start_sample << ", "
                            << boundary.end_sample << ") -> " << r.output_path);
    return r;
}

// First failure in track order, preferring real failures over Skipped markers.
SplitStatus summarize(const std::vector<TrackResult> &tracks) {
    const TrackResult *skipped = nullptr;
    for (const auto &t : tracks) {
        if (t.status.ok) {
            continue;
        }
        if (t.status.kind != ErrorKind::Skipped) {
            return t.status;
        }
        if (!skipped) {
            skipped = &t;
        }
    }
    return skipped ? skipped->status : SplitStatus{};
}

#ifdef DSDSLICER_TESTING
std::atomic<unsigned> g_worker_start_limit{~0u};
#endif

template <typename Fn>
void start_worker(std::vector<std::thread> &pool, Fn &fn) {
#ifdef DSDSLICER_TESTING
    if (pool.size() >= g_worker_start_limit.load()) {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                "worker start limit");
    }
#endif
    pool.emplace_back(fn);
}

// Container and boundaries of one source, validated before any output is written.
struct PreparedGroup {
    DsfDescriptor desc;
    std::vector<TrackBoundary> boundaries;
};

std::optional<PreparedGroup> prepare_group(const std::vector<TrackEntry> &tracks,
                                           const ByteSource &source, const SplitOptions &options,
                                           SplitStatus &status) {
    auto desc = parse_dsf(source, status);
    if (!desc) {
        return std::nullopt;
    }
    auto boundaries = compute_boundaries(tracks, desc->sampling_frequency, desc->sample_count,
                                         options.allow_leading_gap, status);
    if (!boundaries) {
        return std::nullopt;
    }
    return PreparedGroup{std::move(*desc), std::move(*boundaries)};
}

// Extract and write every track of a prepared group on the worker pool.
SplitReport run_group(const std::vector<TrackEntry> &tracks, const PreparedGroup &group,
                      const AlbumInfo &album, const std::filesystem::path &out_dir,
                      const SplitOptions &options) {
    SplitReport report;
    const size_t n = tracks.size();
    report.tracks.reserve(n);
    for (const auto &t : tracks) {
        report.tracks.push_back(skipped_result(t, out_dir));
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> stop{false};
    auto worker = [&]() {
        for (;;) {
            if (options.fail_fast && stop.load()) {
                return;
            }
            const size_t i = next.fetch_add(1);
            if (i >= n) {
                return;
            }
            TrackResult r = process_track(group.desc, tracks[i], group.boundaries[i], album,
                                          out_dir, options);
            if (!r.status.ok) {
                stop.store(true);
            }
            report.tracks[i] = std::move(r);
        }
    };

    const unsigned jobs = dsdslicer::effective_jobs(options, n);
    const auto t0 = std::chrono::steady_clock::now();
    if (jobs == 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(jobs);
        bool spawn_failed = false;
        for (unsigned j = 0; j < jobs; ++j) {
            try {
                start_worker(pool, worker);
            } catch (const std::system_error &e) {
                DS_LOG("warn", "started " << pool.size() << " of " << jobs
                                          << " workers: " << e.what());
                spawn_failed = true;
                break;
            }
        }
        // The calling thread drains whatever the started workers do not pick up.
        if (spawn_failed) {
            worker();
        }
        for (auto &t : pool) {
            t.join();
        }
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();

    report.status = summarize(report.tracks);
    DS_LOG("debug", "run_group tracks=" << n << " jobs=" << jobs << " elapsed_ms=" << ms
                                        << " ok=" << report.status.ok);
    return report;
}

// Split the tracks that share `source`.
SplitReport split_group(const std::vector<TrackEntry> &tracks, const AlbumInfo &album,
                        const ByteSource &source, const std::filesystem::path &out_dir,
                        const SplitOptions &options) {
    SplitReport report;
    if (!check_output_directory(out_dir, report.status)) {
        return report;
    }
    auto group = prepare_group(tracks, source, options, report.status);
    if (!group) {
        return report;
    }
    return run_group(tracks, *group, album, out_dir, options);
}

void append_group(SplitReport &total, SplitReport &&group) {
    for (auto &t : group.tracks) {
        total.tracks.push_back(std::move(t));
    }
    if (total.status.ok && !group.status.ok) {
        total.status = std::move(group.status);
    }
}

// Mark every track of `tracks` with `status` (a failure that hit the whole group).
void append_failed_group(SplitReport &total, const std::vector<TrackEntry> &tracks,
                         const std::filesystem::path &out_dir, const SplitStatus &status) {
    for (const auto &t : tracks) {
        TrackResult r = planned_result(t, out_dir);
        r.status = status;
        r.status.track_number = t.number;
        total.tracks.push_back(std::move(r));
    }
    if (total.status.ok) {
        total.status = status;
    }
}

}  // namespace

namespace dsdslicer {

SplitReport split(std::string_view track_list_text, const ByteSource &source,
                  const std::filesystem::path &output_directory, const SplitOptions &options) {
    SplitReport report;
    auto sheet = parse_cue_sheet(track_list_text, report.status);
    if (!sheet) {
        return report;
    }
    DS_LOG("debug", "split: tracks=" << sheet->all_tracks().size() << " source_bytes="
                                     << source.size() << " out=" << output_directory.string());
    return split_group(sheet->all_tracks(), album_info(*sheet), source, output_directory,
                       options);
}

SplitReport split_file(const std::string &track_list_path, const std::string &source_path,
                       const std::string &output_directory, const SplitOptions &options) {
    SplitReport report;
    auto text = load_text_file(track_list_path, report.status);
    if (!text) {
        return report;
    }
    auto source = FileByteSource::open(source_path);
    if (!source) {
        report.status.fail(ErrorKind::IOReadError, "cannot open source " + source_path);
        return report;
    }
    return split(*text, *source, output_directory, options);
}

SplitReport split_cue(const std::string &cue_path, const std::string &output_directory,
                      const SplitOptions &options) {
    SplitReport report;
    auto text = load_text_file(cue_path, report.status);
    if (!text) {
        return report;
    }
    auto sheet = parse_cue_sheet(*text, report.status);
    if (!sheet) {
        return report;
    }
    for (const auto &group : sheet->files) {
        if (group.path.empty() && !group.tracks.empty()) {
            report.status.fail(ErrorKind::InvalidTrackListFormat,
                               "track " + std::to_string(group.tracks.front().number) +
                                   " is declared before any FILE entry");
            report.status.track_number = group.tracks.front().number;
            DS_LOG("error", report.status.message);
            return report;
        }
    }

    const std::filesystem::path base = std::filesystem::path(cue_path).parent_path();
    const std::filesystem::path out_dir =
        output_directory.empty() ? (base.empty() ? std::filesystem::path(".") : base)
                                 : std::filesystem::path(output_directory);
    const AlbumInfo album = album_info(*sheet);
    if (!check_output_directory(out_dir, report.status)) {
        return report;
    }

    // Open and validate every source first so a bad later FILE leaves no output behind.
    std::vector<std::unique_ptr<FileByteSource>> sources;
    std::vector<PreparedGroup> prepared;
    for (size_t g = 0; g < sheet->files.size(); ++g) {
        const auto &group = sheet->files[g];
        const std::filesystem::path source_path = base / group.path;
        SplitStatus status;
        auto source = FileByteSource::open(source_path.string());
        std::optional<PreparedGroup> ready;
        if (!source) {
            status.fail(ErrorKind::IOReadError, "cannot open source " + source_path.string());
        } else {
            ready = prepare_group(group.tracks, *source, options, status);
        }
        if (!ready) {
            const SplitStatus skipped = make_error(
                ErrorKind::Skipped, "not attempted because " + source_path.string() + " failed");
            for (size_t k = 0; k < sheet->files.size(); ++k) {
                append_failed_group(report, sheet->files[k].tracks, out_dir,
                                    k == g ? status : skipped);
            }
            report.status = status;
            return report;
        }
        DS_LOG("info", "source " << source_path.string() << " tracks=" << group.tracks.size());
        sources.push_back(std::move(source));
        prepared.push_back(std::move(*ready));
    }

    for (size_t g = 0; g < sheet->files.size(); ++g) {
        const auto &group = sheet->files[g];
        if (!report.status.ok && options.fail_fast) {
            SplitStatus first = report.status;
            append_failed_group(report, group.tracks, out_dir,
                                make_error(ErrorKind::Skipped,
                                           "not attempted after an earlier failure"));
            report.status = first;
            continue;
        }
        append_group(report, run_group(group.tracks, prepared[g], album, out_dir, options));
    }
    return report;
}

#ifdef DSDSLICER_TESTING
void set_worker_start_limit_for_test(unsigned limit) { g_worker_start_limit.store(limit); }
#endif

std::optional<DsfDescriptor> inspect_dsf(const std::string &path, SplitStatus &status) {
    auto source = FileByteSource::open(path);
    if (!source) {
        status.fail(ErrorKind::IOReadError, "cannot open " + path);
        return std::nullopt;
    }
    auto desc = parse_dsf(*source, status);
    if (desc) {
        desc->source = nullptr;
    }
    return desc;
}

}  // namespace dsdslicer
