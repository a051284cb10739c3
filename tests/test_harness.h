#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

#include "core/image.h"

namespace fs = std::filesystem;

inline int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                   \
    do {                                                                                    \
        if (!(cond)) {                                                                      \
            ++g_failures;                                                                   \
            std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond    \
                      << "\n";                                                              \
        }                                                                                   \
    } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                     \
    do {                                                                                    \
        const auto _a = (a);                                                                \
        const auto _b = (b);                                                                \
        if (!(_a == _b)) {                                                                  \
            ++g_failures;                                                                   \
            std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a         \
                      << " == " << #b << "\n";                                              \
        }                                                                                   \
    } while (0)

#define ASSERT_TRUE(cond)                                                                   \
    do {                                                                                    \
        if (!(cond)) {                                                                      \
            ++g_failures;                                                                   \
            std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond    \
                      << "\n";                                                              \
            return;                                                                         \
        }                                                                                   \
    } while (0)

// Redirects `stream` into a buffer for its lifetime.
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream) : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { stream_.rdbuf(previous_); }
    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    std::string text() const { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

inline fs::path make_temp_dir(const std::string& prefix) {
    static std::uint64_t counter = 0;
    ++counter;

    std::error_code ec;
    fs::path root = fs::temp_directory_path(ec);
    if (ec || root.empty()) {
        root = fs::current_path(ec);
        if (ec || root.empty()) {
            root = fs::path(".");
        }
    }

    const auto stamp = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    fs::path dir = root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
    fs::create_directories(dir, ec);
    return dir;
}

inline roleicon::core::Image make_filled(int width, int height,
                                         unsigned char r, unsigned char g, unsigned char b, unsigned char a) {
    roleicon::core::Image image = roleicon::core::make_blank(width, height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            unsigned char* p = image.pixel(x, y);
            p[0] = r;
            p[1] = g;
            p[2] = b;
            p[3] = a;
        }
    }
    return image;
}

inline int report_results(const char* suite) {
    if (g_failures == 0) {
        std::cout << suite << ": OK\n";
        return 0;
    }
    std::cerr << suite << ": FAILED (" << g_failures << ")\n";
    return 1;
}
