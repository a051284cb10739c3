#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace roleicon::core {

constexpr int NUM_CHANNELS = 4;
constexpr size_t CHANNEL_R = 0;
constexpr size_t CHANNEL_G = 1;
constexpr size_t CHANNEL_B = 2;
constexpr size_t CHANNEL_A = 3;
constexpr int MAX_CHANNEL_VALUE = 255;

// Straight (non-premultiplied) RGBA8, rows top to bottom.
struct Image {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels;

    bool empty() const { return width <= 0 || height <= 0; }
    unsigned char* pixel(int x, int y);
    const unsigned char* pixel(int x, int y) const;
};

Image make_blank(int width, int height);
inline Image make_blank(int size) { return make_blank(size, size); }

bool load_image(const std::filesystem::path& path, Image& out, std::string& error);
bool save_png(const std::filesystem::path& path, const Image& image, std::string& error);

// Size `image` would take after fitting inside box_w x box_h without
// upscaling, keeping its aspect ratio as closely as integer sizes allow.
void thumbnail_size(int width, int height, int box_w, int box_h, int& out_w, int& out_h);

// Copy of `image` fitted inside box_w x box_h. Images already inside the
// box come back unchanged.
bool thumbnail(const Image& image, int box_w, int box_h, Image& out, std::string& error);

// Separable Gaussian blur with standard deviation `radius`.
Image gaussian_blur(const Image& image, double radius);

// Paste `src` at (x, y) using src's alpha channel as the blend mask, applied
// to every channel of `dst` including alpha. Parts outside `dst` are clipped.
void paste(Image& dst, const Image& src, int x, int y);

} // namespace roleicon::core
