//
//  track_naming.hpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

inline constexpr std::string_view kDsfExtension = ".dsf";

// Replace characters that are invalid in file names with '_' and trim trailing dots/spaces.
std::string sanitize_filename(std::string_view name);

// "NN - Title.dsf"; "NN - Track NN.dsf" when the title is empty. A title that already starts
// with "NN - " keeps only one prefix.
std::string output_filename(uint32_t track_number, std::string_view title);
