#pragma once

#include <string>

#include "image.h"

namespace roleicon::core {

struct LayerParams {
    int canvas_size = 0;
    int blur_radius = 0;
    int shadow_offset = 0;
    int margin = 0;
};

// Opaque black copy of `icon` keeping its alpha, blurred by `blur_radius`.
Image build_shadow(const Image& icon, int blur_radius);

// Transparent canvas_size x canvas_size layer with `source` fitted inside
// (canvas_size - 2 * margin) and centered. When blur_radius > 0 a drop shadow
// is pasted first, shifted by shadow_offset on both axes.
bool make_layer(const Image& source, const LayerParams& params, Image& out, std::string& error);

} // namespace roleicon::core
