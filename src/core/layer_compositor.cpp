#include "layer_compositor.h"

#include <algorithm>

namespace roleicon::core {

Image build_shadow(const Image& icon, int blur_radius) {
    Image shadow = make_blank(icon.width, icon.height);
    for (int y = 0; y < icon.height; ++y) {
        for (int x = 0; x < icon.width; ++x) {
            shadow.pixel(x, y)[CHANNEL_A] = icon.pixel(x, y)[CHANNEL_A];
        }
    }
    return gaussian_blur(shadow, static_cast<double>(blur_radius));
}

bool make_layer(const Image& source, const LayerParams& params, Image& out, std::string& error) {
    if (params.canvas_size <= 0) {
        error = "Invalid layer size " + std::to_string(params.canvas_size);
        return false;
    }

    const int thumb = std::max(params.canvas_size - (2 * params.margin), 1);
    Image icon;
    if (!thumbnail(source, thumb, thumb, icon, error)) {
        return false;
    }

    Image layer = make_blank(params.canvas_size);
    if (params.blur_radius > 0) {
        const Image shadow = build_shadow(icon, params.blur_radius);
        paste(layer,
              shadow,
              ((params.canvas_size - shadow.width) / 2) + params.shadow_offset,
              ((params.canvas_size - shadow.height) / 2) + params.shadow_offset);
    }

    paste(layer, icon, (params.canvas_size - icon.width) / 2, (params.canvas_size - icon.height) / 2);
    out = std::move(layer);
    return true;
}

} // namespace roleicon::core
