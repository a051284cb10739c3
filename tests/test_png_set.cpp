#include "test_harness.h"

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "core/png_set.h"

using namespace roleicon::core;

static std::vector<char> read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

static bool write_source(const fs::path& path, int w, int h) {
    std::string error;
    return save_png(path, make_filled(w, h, 220, 40, 40, 255), error);
}

static void expect_png_size(const fs::path& path, int size) {
    Image image;
    std::string error;
    if (!load_image(path, image, error)) {
        ++g_failures;
        std::cerr << "failed to load " << path << ": " << error << "\n";
        return;
    }
    EXPECT_EQ(image.width, size);
    EXPECT_EQ(image.height, size);
}

static void test_default_sizes_without_templates() {
    const fs::path dir = make_temp_dir("roleicon_pngset");
    const fs::path templates = dir / "templates";
    fs::create_directories(templates);
    ASSERT_TRUE(write_source(dir / "source.png", 512, 512));

    PngSetRequest request{dir / "source.png", "test", dir / "out" / "converted" / "test", templates};
    std::vector<GeneratedPng> generated;
    std::string error;
    ASSERT_TRUE(create_png_set(request, generated, error));
    EXPECT_EQ(generated.size(), static_cast<size_t>(4));

    expect_png_size(request.output_dir / "tab_test.png", 16);
    expect_png_size(request.output_dir / "score_test.png", 64);
    expect_png_size(request.output_dir / "sprite_test.png", 256);
    expect_png_size(request.output_dir / "icon_test.png", 256);

    size_t file_count = 0;
    for (const auto& entry : fs::directory_iterator(request.output_dir)) {
        EXPECT_EQ(entry.path().extension().string(), std::string(".png"));
        ++file_count;
    }
    EXPECT_EQ(file_count, static_cast<size_t>(4));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

static void test_templates_drive_canvas_size() {
    const fs::path dir = make_temp_dir("roleicon_pngset_tpl");
    ASSERT_TRUE(write_source(dir / "source.png", 300, 300));
    std::string error;
    ASSERT_TRUE(save_png(dir / "sprite_template.png", make_filled(128, 128, 0, 0, 255, 255), error));
    ASSERT_TRUE(save_png(dir / "score_template.png", make_filled(32, 32, 0, 255, 0, 255), error));

    PngSetRequest request{dir / "source.png", "tpl", dir / "out", dir};
    std::vector<GeneratedPng> generated;
    ASSERT_TRUE(create_png_set(request, generated, error));

    expect_png_size(dir / "out" / "sprite_tpl.png", 128);
    expect_png_size(dir / "out" / "icon_tpl.png", 256);
    expect_png_size(dir / "out" / "score_tpl.png", 64);

    Image sprite;
    ASSERT_TRUE(load_image(dir / "out" / "sprite_tpl.png", sprite, error));
    // Template background survives outside the icon.
    EXPECT_EQ(sprite.pixel(0, 0)[CHANNEL_B], 255);
    EXPECT_EQ(sprite.pixel(0, 0)[CHANNEL_A], 255);

    Image score;
    ASSERT_TRUE(load_image(dir / "out" / "score_tpl.png", score, error));
    // score_template.png is never used: the score canvas is blank and the
    // opaque icon fills it edge to edge.
    EXPECT_TRUE(score.pixel(0, 0)[CHANNEL_G] < 100);
    EXPECT_EQ(score.pixel(0, 0)[CHANNEL_A], 255);

    for (const GeneratedPng& png : generated) {
        EXPECT_EQ(png.from_template, png.variant == Variant::Sprite);
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}

static void test_score_canvas_ignores_template() {
    const fs::path dir = make_temp_dir("roleicon_score");
    std::string error;
    ASSERT_TRUE(save_png(dir / "score_template.png", make_filled(32, 32, 0, 255, 0, 255), error));

    Image canvas;
    bool from_template = true;
    ASSERT_TRUE(resolve_canvas(variant_spec(Variant::Score), dir, canvas, from_template, error));
    EXPECT_FALSE(from_template);
    EXPECT_EQ(canvas.width, 64);
    EXPECT_EQ(canvas.pixel(0, 0)[CHANNEL_A], 0);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

static void test_broken_template_is_fatal() {
    const fs::path dir = make_temp_dir("roleicon_badtpl");
    ASSERT_TRUE(write_source(dir / "source.png", 64, 64));
    {
        std::ofstream bad(dir / "icon_template.png", std::ios::binary);
        bad << "not a png";
    }

    PngSetRequest request{dir / "source.png", "bad", dir / "out", dir};
    std::vector<GeneratedPng> generated;
    std::string error;
    EXPECT_FALSE(create_png_set(request, generated, error));
    EXPECT_TRUE(error.find("icon_template.png") != std::string::npos);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

static void test_missing_source_writes_nothing() {
    const fs::path dir = make_temp_dir("roleicon_nosrc");
    PngSetRequest request{dir / "missing.png", "none", dir / "out", dir};
    std::vector<GeneratedPng> generated;
    std::string error;
    EXPECT_FALSE(create_png_set(request, generated, error));
    EXPECT_TRUE(generated.empty());
    EXPECT_FALSE(fs::exists(dir / "out"));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

static void test_rerun_is_identical() {
    const fs::path dir = make_temp_dir("roleicon_rerun");
    ASSERT_TRUE(write_source(dir / "source.png", 100, 60));

    PngSetRequest request{dir / "source.png", "same", dir / "out", dir};
    std::vector<GeneratedPng> generated;
    std::string error;
    ASSERT_TRUE(create_png_set(request, generated, error));
    const std::vector<char> first = read_bytes(dir / "out" / "icon_same.png");
    ASSERT_TRUE(create_png_set(request, generated, error));
    const std::vector<char> second = read_bytes(dir / "out" / "icon_same.png");
    EXPECT_FALSE(first.empty());
    EXPECT_TRUE(first == second);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

int main() {
    test_default_sizes_without_templates();
    test_templates_drive_canvas_size();
    test_score_canvas_ignores_template();
    test_broken_template_is_fatal();
    test_missing_source_writes_nothing();
    test_rerun_is_identical();
    return report_results("roleicon_png_set_tests");
}
