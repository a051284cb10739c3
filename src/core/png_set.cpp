#include "png_set.h"

#include <system_error>

#include "cli_parse.h"
#include "layer_compositor.h"

namespace fs = std::filesystem;

namespace roleicon::core {

bool resolve_canvas(const VariantSpec& spec,
                    const fs::path& template_dir,
                    Image& canvas,
                    bool& from_template,
                    std::string& error) {
    from_template = false;
    if (spec.template_policy == TemplatePolicy::Optional && !template_dir.empty()) {
        const fs::path template_path = template_dir / fs::path(std::string(spec.template_name));
        std::error_code ec;
        if (fs::exists(template_path, ec) && !ec) {
            if (!load_image(template_path, canvas, error)) {
                error = "Failed to load template: " + error;
                return false;
            }
            from_template = true;
            return true;
        }
    }
    canvas = make_blank(spec.default_size);
    return true;
}

bool create_png_set(const PngSetRequest& request, std::vector<GeneratedPng>& generated, std::string& error) {
    generated.clear();

    Image source;
    if (!load_image(request.source_path, source, error)) {
        return false;
    }

    std::error_code ec;
    fs::create_directories(request.output_dir, ec);
    if (ec) {
        error = "Failed to create output directory " + to_quoted(request.output_dir.string()) + ": " + ec.message();
        return false;
    }

    for (const VariantSpec& spec : k_variant_specs) {
        const fs::path output_path = request.output_dir / variant_png_name(spec.variant, request.ns);
        Image result;
        bool from_template = false;

        if (spec.template_policy == TemplatePolicy::None) {
            const LayerParams params{spec.default_size, spec.blur_radius, spec.shadow_offset, spec.margin};
            if (!make_layer(source, params, result, error)) {
                return false;
            }
        } else {
            if (!resolve_canvas(spec, request.template_dir, result, from_template, error)) {
                return false;
            }
            // Templates are assumed square; the width drives the layer size.
            const int size = result.width;
            const LayerParams params{size, spec.blur_radius, spec.shadow_offset, spec.margin};
            Image layer;
            if (!make_layer(source, params, layer, error)) {
                return false;
            }
            paste(result, layer, (size - layer.width) / 2, (size - layer.height) / 2);
        }

        if (!save_png(output_path, result, error)) {
            return false;
        }
        generated.push_back({spec.variant, output_path, result.width, from_template});
    }
    return true;
}

} // namespace roleicon::core
