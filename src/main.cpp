//
//  main.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "dsdslicer.hpp"
#include "dsdslicer_version.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

namespace {

void print_usage() {
    std::cerr << "DsdSlicer " << DSDSLICER_VERSION_DISPLAY << "\n\n"
              << "usage for reading:\n"
              << "  dsdslicer <input.dsf> [--log-level warn|info|debug]\n"
              << "usage for splitting:\n"
              << "  dsdslicer <sheet.cue> [--source FILE.dsf] [-o DIR] [options]\n"
              << "Options:\n"
              << "  --source FILE        Split FILE along all tracks of the sheet, ignoring its\n"
              << "                       FILE entries.\n"
              << "  -o, --output DIR     Output directory (default: the sheet's directory).\n"
              << "  --force              Overwrite existing output files.\n"
              << "  --keep-going         Continue with remaining tracks after a failure.\n"
              << "  --jobs N             Number of worker threads (0 = all cores, default 1).\n"
              << "  --no-tags            Do not embed ID3v2 tags.\n"
              << "  --lsb-first          Treat bit 0 of each byte as the first sample.\n"
              << "  --allow-leading-gap  Accept a first track that does not start at 00:00:00.\n"
              << "  --config FILE        Load options from a JSON file (flags override it).\n"
              << "  --json               Print the split report as JSON.\n"
              << "  --log-level LEVEL    Set logging verbosity (default: info).\n";
}

nlohmann::json status_json(const dsdslicer::SplitStatus &s) {
    nlohmann::json j;
    j["ok"] = s.ok;
    if (!s.ok) {
        j["kind"] = std::string(dsdslicer::error_kind_name(s.kind));
        j["message"] = s.message;
        if (s.track_number) {
            j["track"] = *s.track_number;
        }
        if (s.byte_offset) {
            j["offset"] = *s.byte_offset;
        }
        if (s.line_number) {
            j["line"] = *s.line_number;
        }
    }
    return j;
}

void emit_descriptor_json(const DsfDescriptor &d) {
    nlohmann::json j;
    j["format_version"] = d.format_version;
    j["format_id"] = d.format_id;
    j["channel_type"] = d.channel_type;
    j["channel_count"] = d.channel_count;
    j["sampling_frequency"] = d.sampling_frequency;
    j["bits_per_sample"] = d.bits_per_sample;
    j["sample_count"] = d.sample_count;
    j["block_size_per_channel"] = d.block_size_per_channel;
    j["block_count"] = d.block_count();
    j["duration_seconds"] =
        d.sampling_frequency ? static_cast<double>(d.sample_count) / d.sampling_frequency : 0.0;
    j["file_size"] = d.file_size;
    j["data_offset"] = d.data_offset;
    j["data_size"] = d.data_size;
    j["metadata_offset"] = d.metadata_offset;
    j["metadata_size"] = d.metadata_size;
    std::cout << j.dump(2) << "\n";
}

void emit_report(const dsdslicer::SplitReport &report, bool as_json) {
    if (as_json) {
        nlohmann::json j = status_json(report.status);
        nlohmann::json tracks = nlohmann::json::array();
        for (const auto &t : report.tracks) {
            nlohmann::json e = status_json(t.status);
            e["track"] = t.track_number;
            e["output"] = t.output_path;
            tracks.push_back(e);
        }
        j["tracks"] = tracks;
        std::cout << j.dump(2) << "\n";
        return;
    }
    for (const auto &t : report.tracks) {
        if (t.status.ok) {
            std::cout << "Wrote: " << t.output_path << "\n";
        } else {
            std::cout << "Track " << t.track_number << ": " << t.status.describe() << "\n";
        }
    }
}

bool parse_jobs(const std::string &s, unsigned &jobs) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 4) {
        return false;
    }
    jobs = static_cast<unsigned>(std::stoul(s));
    return true;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "DsdSlicer " << DSDSLICER_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Flags given on the command line are applied over --config afterwards.
    std::vector<std::string> positional;
    std::string source_path;
    std::string output_dir;
    std::string config_path;
    bool as_json = false;
    bool force = false, keep_going = false, no_tags = false, lsb_first = false, leading_gap = false;
    std::optional<unsigned> jobs;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--force") {
            force = true;
        } else if (arg == "--keep-going") {
            keep_going = true;
        } else if (arg == "--no-tags") {
            no_tags = true;
        } else if (arg == "--lsb-first") {
            lsb_first = true;
        } else if (arg == "--allow-leading-gap") {
            leading_gap = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--jobs" && has_value) {
            unsigned n = 0;
            if (!parse_jobs(argv[++i], n)) {
                std::cerr << "Invalid --jobs value: " << argv[i] << "\n";
                return 2;
            }
            jobs = n;
        } else if (arg == "--source" && has_value) {
            source_path = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && has_value) {
            output_dir = argv[++i];
        } else if (arg == "--config" && has_value) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            dsdslicer::set_log_verbosity(dsdslicer::parse_log_verbosity(argv[++i]));
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 1) {
        print_usage();
        return 2;
    }
    const std::string input_path = positional[0];

    // Reading mode: a DSF container.
    if (std::filesystem::path(input_path).extension() == ".dsf") {
        dsdslicer::SplitStatus status;
        auto desc = dsdslicer::inspect_dsf(input_path, status);
        if (!desc) {
            DS_LOG("error", "dsdslicer: failed to read dsf: " << status.describe());
            return 1;
        }
        emit_descriptor_json(*desc);
        return 0;
    }

    // Splitting mode: a CUE sheet.
    dsdslicer::SplitOptions options;
    if (!config_path.empty()) {
        dsdslicer::SplitStatus status;
        auto loaded = dsdslicer::load_split_options_json(config_path, status);
        if (!loaded) {
            std::cerr << "Invalid --config: " << status.describe() << "\n";
            return 2;
        }
        options = *loaded;
    }
    options.overwrite_existing |= force;
    options.fail_fast = options.fail_fast && !keep_going;
    options.embed_metadata = options.embed_metadata && !no_tags;
    options.allow_leading_gap |= leading_gap;
    if (lsb_first) {
        options.bit_order = BitOrder::LsbFirst;
    }
    if (jobs) {
        options.jobs = *jobs;
    }

    dsdslicer::SplitReport report;
    if (!source_path.empty()) {
        std::string out = output_dir;
        if (out.empty()) {
            auto parent = std::filesystem::path(input_path).parent_path();
            out = parent.empty() ? "." : parent.string();
        }
        report = dsdslicer::split_file(input_path, source_path, out, options);
    } else {
        report = dsdslicer::split_cue(input_path, output_dir, options);
    }

    emit_report(report, as_json);
    if (!report.ok()) {
        DS_LOG("error", "dsdslicer: split failed: " << report.status.describe());
        return 1;
    }
    return 0;
}
