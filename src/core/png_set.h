#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "image.h"
#include "variants.h"

namespace roleicon::core {

struct PngSetRequest {
    std::filesystem::path source_path;
    std::string ns;
    std::filesystem::path output_dir;
    std::filesystem::path template_dir;
};

struct GeneratedPng {
    Variant variant;
    std::filesystem::path path;
    int size = 0;
    bool from_template = false;
};

// Picks the canvas for `spec`: the template from `template_dir` when the
// variant's policy allows it and the file exists, else a blank square of the
// default size.
bool resolve_canvas(const VariantSpec& spec,
                    const std::filesystem::path& template_dir,
                    Image& canvas,
                    bool& from_template,
                    std::string& error);

// Writes tab, score, sprite and icon PNGs for `request.ns` into
// `request.output_dir`, creating it if needed. The source image is loaded
// before anything touches the filesystem.
bool create_png_set(const PngSetRequest& request, std::vector<GeneratedPng>& generated, std::string& error);

} // namespace roleicon::core
