#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace handpose
{
namespace camera
{

    // Frame format for image processing
    enum class PixelFormat
    {
        RGB888, // 24-bit RGB
        BGR888, // 24-bit BGR (OpenCV / V4L2 capture order)
        UNKNOWN
    };

    // Axis-aligned rectangle in pixel coordinates
    struct Rect
    {
        int x, y;
        int width, height;

        Rect() : x(0), y(0), width(0), height(0) {}
        Rect(int x_, int y_, int w_, int h_) : x(x_), y(y_), width(w_), height(h_) {}

        int area() const { return width * height; }
    };

    // Represents a single camera frame
    struct Frame
    {
        std::vector<uint8_t> data; // Raw pixel data
        size_t size;               // Data size in bytes
        uint32_t width;            // Frame width
        uint32_t height;           // Frame height
        PixelFormat format;        // Pixel format
        uint64_t timestamp_ns;     // Capture timestamp (nanoseconds)
        int stride;                // Bytes per row

        Frame() : data(), size(0), width(0), height(0),
                  format(PixelFormat::UNKNOWN), timestamp_ns(0), stride(0) {}

        // Allocate a zeroed frame of the given size
        static Frame create(uint32_t width, uint32_t height,
                            PixelFormat format = PixelFormat::RGB888);

        // True when the buffer can hold width x height 3-channel pixels
        bool is_valid() const;

        // Get pixel at (x, y) as RGB regardless of channel order
        bool get_rgb(uint32_t x, uint32_t y, uint8_t &r, uint8_t &g, uint8_t &b) const;

        // Set pixel at (x, y) from RGB regardless of channel order
        bool set_rgb(uint32_t x, uint32_t y, uint8_t r, uint8_t g, uint8_t b);
    };

    // Single-channel binary image (255 = foreground, 0 = background)
    struct Mask
    {
        std::vector<uint8_t> data;
        uint32_t width;
        uint32_t height;

        Mask() : data(), width(0), height(0) {}
        Mask(uint32_t w, uint32_t h, uint8_t fill = 0)
            : data(static_cast<size_t>(w) * h, fill), width(w), height(h) {}

        bool empty() const { return data.empty() || width == 0 || height == 0; }
        bool same_size(uint32_t w, uint32_t h) const { return width == w && height == h; }

        uint8_t at(uint32_t x, uint32_t y) const { return data[static_cast<size_t>(y) * width + x]; }
        uint8_t &at(uint32_t x, uint32_t y) { return data[static_cast<size_t>(y) * width + x]; }

        size_t count_nonzero() const;
    };

    // Utility functions for frame I/O and mask construction
    namespace utils
    {
        // Read a binary PPM (P6, maxval 255) into an RGB888 frame
        bool load_ppm(const std::string &path, Frame &frame);

        // Write a frame as binary PPM (P6)
        bool save_ppm(const std::string &path, const Frame &frame);

        // Write a mask as binary PGM (P5)
        bool save_pgm(const std::string &path, const Mask &mask);

        // Build an exclusion mask: 255 everywhere except the given rectangles
        // (grown by padding and clamped to the image), which are zeroed.
        Mask make_exclusion_mask(uint32_t width, uint32_t height,
                                 const std::vector<Rect> &excluded,
                                 int padding = 10);
    }

} // namespace camera
} // namespace handpose
