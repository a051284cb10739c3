#include "vtf_convert.h"

#include <iostream>
#include <system_error>

#include "cli_parse.h"
#include "variants.h"

namespace fs = std::filesystem;

namespace roleicon::core {

ConversionReport convert_format(const fs::path& output_dir,
                                std::string_view ns,
                                bool skip,
                                const fs::path& converter_path,
                                ProcessRunner& runner) {
    ConversionReport report;
    if (skip) {
        std::cout << "Skipping VTF conversion.\n";
        report.skipped = true;
        return report;
    }

    std::error_code ec;
    if (converter_path.empty() || !fs::exists(converter_path, ec) || ec) {
        std::cerr << "Warning: VTFCmd not found at " << to_quoted(converter_path.string()) << "; skipping.\n";
        report.converter_missing = true;
        return report;
    }

    for (Variant variant : {Variant::Sprite, Variant::Icon}) {
        const fs::path png = output_dir / variant_png_name(variant, ns);
        std::cout << "Converting " << png.filename().string() << "...\n";

        ProcessResult result;
        std::string error;
        if (!runner.run(converter_path, {"-file", png.string(), "-output", output_dir.string()}, result, error)) {
            std::cerr << "Warning: VTFCmd could not be started for " << png.filename().string() << ": " << error << "\n";
            ++report.failed;
            continue;
        }
        if (result.exit_code != 0) {
            std::cerr << "Warning: VTFCmd failed on " << png.filename().string() << ": exit " << result.exit_code << "\n";
            if (!result.output.empty()) {
                std::cerr << result.output;
                if (result.output.back() != '\n') {
                    std::cerr << "\n";
                }
            }
            ++report.failed;
            continue;
        }
        std::cout << result.output;
        ++report.converted;
    }
    return report;
}

} // namespace roleicon::core
