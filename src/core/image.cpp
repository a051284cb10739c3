#include "image.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize2.h>

#include "cli_parse.h"

namespace roleicon::core {

namespace {

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

// Picks floor or ceil of `number`, whichever `distance` rates closer; ties
// keep the floor. Never returns less than 1.
template <typename Distance>
int round_aspect(double number, Distance distance) {
    const double lo = std::floor(number);
    const double hi = std::ceil(number);
    const double picked = distance(hi) < distance(lo) ? hi : lo;
    return std::max(static_cast<int>(picked), 1);
}

std::vector<float> gaussian_kernel(double sigma) {
    const int half = static_cast<int>(std::ceil(sigma * 3.0));
    std::vector<float> kernel(static_cast<size_t>(half) * 2 + 1);
    double sum = 0.0;
    for (int i = -half; i <= half; ++i) {
        const double w = std::exp(-(static_cast<double>(i) * i) / (2.0 * sigma * sigma));
        kernel[static_cast<size_t>(i + half)] = static_cast<float>(w);
        sum += w;
    }
    for (float& w : kernel) {
        w = static_cast<float>(w / sum);
    }
    return kernel;
}

unsigned char clamp_channel(float value) {
    const float rounded = std::round(value);
    if (rounded <= 0.0f) {
        return 0;
    }
    if (rounded >= static_cast<float>(MAX_CHANNEL_VALUE)) {
        return MAX_CHANNEL_VALUE;
    }
    return static_cast<unsigned char>(rounded);
}

// One blur pass along x (horizontal) or y, clamping samples at the edges.
void blur_pass(const Image& in, Image& out, const std::vector<float>& kernel, bool horizontal) {
    const int half = static_cast<int>(kernel.size() / 2);
    for (int y = 0; y < in.height; ++y) {
        for (int x = 0; x < in.width; ++x) {
            float acc[NUM_CHANNELS] = {0.0f, 0.0f, 0.0f, 0.0f};
            for (int k = -half; k <= half; ++k) {
                int sx = x;
                int sy = y;
                if (horizontal) {
                    sx = std::clamp(x + k, 0, in.width - 1);
                } else {
                    sy = std::clamp(y + k, 0, in.height - 1);
                }
                const unsigned char* src = in.pixel(sx, sy);
                const float w = kernel[static_cast<size_t>(k + half)];
                for (int c = 0; c < NUM_CHANNELS; ++c) {
                    acc[c] += w * static_cast<float>(src[c]);
                }
            }
            unsigned char* dst = out.pixel(x, y);
            for (int c = 0; c < NUM_CHANNELS; ++c) {
                dst[c] = clamp_channel(acc[c]);
            }
        }
    }
}

} // namespace

unsigned char* Image::pixel(int x, int y) {
    return pixels.data() + ((static_cast<size_t>(y) * static_cast<size_t>(width)) + static_cast<size_t>(x)) * NUM_CHANNELS;
}

const unsigned char* Image::pixel(int x, int y) const {
    return pixels.data() + ((static_cast<size_t>(y) * static_cast<size_t>(width)) + static_cast<size_t>(x)) * NUM_CHANNELS;
}

Image make_blank(int width, int height) {
    Image image;
    image.width = std::max(width, 0);
    image.height = std::max(height, 0);
    image.pixels.assign(static_cast<size_t>(image.width) * image.height * NUM_CHANNELS, 0);
    return image;
}

bool load_image(const std::filesystem::path& path, Image& out, std::string& error) {
    int w = 0;
    int h = 0;
    int channels = 0;
    unsigned char* data = stbi_load(path.string().c_str(), &w, &h, &channels, NUM_CHANNELS);
    if (data == nullptr) {
        const char* reason = stbi_failure_reason();
        error = "Failed to load image " + to_quoted(path.string());
        if (reason != nullptr) {
            error += ": ";
            error += reason;
        }
        return false;
    }

    size_t pixel_count = 0;
    size_t byte_count = 0;
    if (!checked_mul_size_t(static_cast<size_t>(w), static_cast<size_t>(h), pixel_count)
        || !checked_mul_size_t(pixel_count, NUM_CHANNELS, byte_count)) {
        stbi_image_free(data);
        error = "Image is too large: " + to_quoted(path.string());
        return false;
    }

    out.width = w;
    out.height = h;
    out.pixels.assign(data, data + byte_count);
    stbi_image_free(data);
    return true;
}

bool save_png(const std::filesystem::path& path, const Image& image, std::string& error) {
    if (image.empty()) {
        error = "Refusing to write empty image " + to_quoted(path.string());
        return false;
    }
    if (stbi_write_png(path.string().c_str(), image.width, image.height, NUM_CHANNELS,
                       image.pixels.data(), image.width * NUM_CHANNELS) == 0) {
        error = "Failed to write PNG " + to_quoted(path.string());
        return false;
    }
    return true;
}

void thumbnail_size(int width, int height, int box_w, int box_h, int& out_w, int& out_h) {
    out_w = width;
    out_h = height;
    if (width <= 0 || height <= 0 || (box_w >= width && box_h >= height)) {
        return;
    }

    const double aspect = static_cast<double>(width) / static_cast<double>(height);
    int x = box_w;
    int y = box_h;
    if (static_cast<double>(x) / y >= aspect) {
        x = round_aspect(y * aspect, [&](double n) { return std::abs(aspect - n / y); });
    } else {
        y = round_aspect(x / aspect, [&](double n) { return n == 0.0 ? 0.0 : std::abs(aspect - x / n); });
    }
    out_w = x;
    out_h = y;
}

bool thumbnail(const Image& image, int box_w, int box_h, Image& out, std::string& error) {
    int target_w = 0;
    int target_h = 0;
    thumbnail_size(image.width, image.height, box_w, box_h, target_w, target_h);
    if (target_w == image.width && target_h == image.height) {
        out = image;
        return true;
    }

    Image resized = make_blank(target_w, target_h);
    void* result = stbir_resize(image.pixels.data(), image.width, image.height, image.width * NUM_CHANNELS,
                                resized.pixels.data(), target_w, target_h, target_w * NUM_CHANNELS,
                                STBIR_RGBA, STBIR_TYPE_UINT8, STBIR_EDGE_CLAMP, STBIR_FILTER_CATMULLROM);
    if (result == nullptr) {
        error = "Failed to resize image to " + std::to_string(target_w) + "x" + std::to_string(target_h);
        return false;
    }
    out = std::move(resized);
    return true;
}

Image gaussian_blur(const Image& image, double radius) {
    if (radius <= 0.0 || image.empty()) {
        return image;
    }
    const std::vector<float> kernel = gaussian_kernel(radius);
    Image horizontal = make_blank(image.width, image.height);
    blur_pass(image, horizontal, kernel, true);
    Image result = make_blank(image.width, image.height);
    blur_pass(horizontal, result, kernel, false);
    return result;
}

void paste(Image& dst, const Image& src, int x, int y) {
    const int x0 = std::max(x, 0);
    const int y0 = std::max(y, 0);
    const int x1 = std::min(x + src.width, dst.width);
    const int y1 = std::min(y + src.height, dst.height);
    for (int dy = y0; dy < y1; ++dy) {
        for (int dx = x0; dx < x1; ++dx) {
            const unsigned char* s = src.pixel(dx - x, dy - y);
            unsigned char* d = dst.pixel(dx, dy);
            const unsigned int mask = s[CHANNEL_A];
            if (mask == 0) {
                continue;
            }
            if (mask == MAX_CHANNEL_VALUE) {
                std::memcpy(d, s, NUM_CHANNELS);
                continue;
            }
            for (int c = 0; c < NUM_CHANNELS; ++c) {
                const unsigned int blended = (d[c] * (MAX_CHANNEL_VALUE - mask)) + (s[c] * mask) + 128;
                d[c] = static_cast<unsigned char>(((blended >> 8) + blended) >> 8);
            }
        }
    }
}

} // namespace roleicon::core
