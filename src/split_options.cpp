//
//  split_options.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "split_options.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <thread>

#include "cue_parser.hpp"
#include "logging.hpp"

using json = nlohmann::json;

namespace dsdslicer {

namespace {

bool read_bool(const json &j, const char *key, bool &dst, SplitStatus &status) {
    if (!j.contains(key)) {
        return true;
    }
    const auto &v = j.at(key);
    if (!v.is_boolean()) {
        return status.fail(ErrorKind::InvalidConfiguration,
                           std::string("option '") + key + "' must be a boolean");
    }
    dst = v.get<bool>();
    return true;
}

}  // namespace

unsigned effective_jobs(const SplitOptions &options, size_t track_count) {
    unsigned jobs = options.jobs;
    if (jobs == 0) {
        jobs = std::max(1u, std::thread::hardware_concurrency());
    }
    if (track_count > 0 && jobs > track_count) {
        jobs = static_cast<unsigned>(track_count);
    }
    return std::max(1u, jobs);
}

std::optional<SplitOptions> parse_split_options_json(std::string_view text, SplitStatus &status,
                                                     const SplitOptions &base) {
    json j = json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        status.fail(ErrorKind::InvalidConfiguration, "options must be a JSON object");
        DS_LOG("error", status.message);
        return std::nullopt;
    }

    SplitOptions opts = base;
    bool ok = read_bool(j, "overwrite", opts.overwrite_existing, status) &&
              read_bool(j, "fail_fast", opts.fail_fast, status) &&
              read_bool(j, "embed_metadata", opts.embed_metadata, status) &&
              read_bool(j, "allow_leading_gap", opts.allow_leading_gap, status);
    if (ok && j.contains("jobs")) {
        const auto &v = j.at("jobs");
        if (!v.is_number_unsigned()) {
            ok = status.fail(ErrorKind::InvalidConfiguration,
                             "option 'jobs' must be a non-negative integer");
        } else {
            opts.jobs = v.get<unsigned>();
        }
    }
    if (ok && j.contains("bit_order")) {
        const auto &v = j.at("bit_order");
        const std::string order = v.is_string() ? v.get<std::string>() : std::string();
        if (order == "msb") {
            opts.bit_order = BitOrder::MsbFirst;
        } else if (order == "lsb") {
            opts.bit_order = BitOrder::LsbFirst;
        } else {
            ok = status.fail(ErrorKind::InvalidConfiguration,
                             "option 'bit_order' must be \"msb\" or \"lsb\"");
        }
    }
    if (!ok) {
        DS_LOG("error", status.message);
        return std::nullopt;
    }
    DS_LOG("debug", "options overwrite=" << opts.overwrite_existing << " fail_fast="
                                         << opts.fail_fast << " jobs=" << opts.jobs
                                         << " tags=" << opts.embed_metadata << " lsb="
                                         << (opts.bit_order == BitOrder::LsbFirst));
    return opts;
}

std::optional<SplitOptions> load_split_options_json(const std::string &path, SplitStatus &status,
                                                    const SplitOptions &base) {
    auto text = load_text_file(path, status);
    if (!text) {
        return std::nullopt;
    }
    return parse_split_options_json(*text, status, base);
}

}  // namespace dsdslicer
