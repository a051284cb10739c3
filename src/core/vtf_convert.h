#pragma once

#include <filesystem>
#include <string_view>

#include "process_runner.h"

namespace roleicon::core {

#ifndef ROLEICON_DEFAULT_VTFCMD_PATH
#define ROLEICON_DEFAULT_VTFCMD_PATH "/usr/local/bin/VTFCmd"
#endif

constexpr const char* k_default_vtfcmd_path = ROLEICON_DEFAULT_VTFCMD_PATH;

struct ConversionReport {
    bool skipped = false;
    bool converter_missing = false;
    int converted = 0;
    int failed = 0;
};

// Runs VTFCmd on the sprite and icon PNGs in `output_dir`. Never fails the
// run: a missing converter or a failing file is reported as a warning and
// the next file is still processed.
ConversionReport convert_format(const std::filesystem::path& output_dir,
                                std::string_view ns,
                                bool skip,
                                const std::filesystem::path& converter_path,
                                ProcessRunner& runner);

} // namespace roleicon::core
