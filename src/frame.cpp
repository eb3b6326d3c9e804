#include "frame.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace handpose
{
namespace camera
{

    Frame Frame::create(uint32_t width, uint32_t height, PixelFormat format)
    {
        Frame frame;
        frame.width = width;
        frame.height = height;
        frame.format = format;
        frame.stride = static_cast<int>(width * 3);
        frame.size = static_cast<size_t>(frame.stride) * height;
        frame.data.assign(frame.size, 0);
        return frame;
    }

    bool Frame::is_valid() const
    {
        if (data.empty() || width == 0 || height == 0)
            return false;
        if (format != PixelFormat::RGB888 && format != PixelFormat::BGR888)
            return false;
        if (stride < static_cast<int>(width * 3))
            return false;
        return data.size() >= static_cast<size_t>(stride) * height;
    }

    bool Frame::get_rgb(uint32_t x, uint32_t y, uint8_t &r, uint8_t &g, uint8_t &b) const
    {
        if (data.empty() || x >= width || y >= height)
            return false;

        const size_t idx = (static_cast<size_t>(y) * stride) + (x * 3);
        if (idx + 2 >= data.size())
            return false;

        if (format == PixelFormat::RGB888)
        {
            r = data[idx];
            g = data[idx + 1];
            b = data[idx + 2];
            return true;
        }
        if (format == PixelFormat::BGR888)
        {
            b = data[idx];
            g = data[idx + 1];
            r = data[idx + 2];
            return true;
        }
        return false;
    }

    bool Frame::set_rgb(uint32_t x, uint32_t y, uint8_t r, uint8_t g, uint8_t b)
    {
        if (data.empty() || x >= width || y >= height)
            return false;

        const size_t idx = (static_cast<size_t>(y) * stride) + (x * 3);
        if (idx + 2 >= data.size())
            return false;

        if (format == PixelFormat::RGB888)
        {
            data[idx] = r;
            data[idx + 1] = g;
            data[idx + 2] = b;
            return true;
        }
        if (format == PixelFormat::BGR888)
        {
            data[idx] = b;
            data[idx + 1] = g;
            data[idx + 2] = r;
            return true;
        }
        return false;
    }

    size_t Mask::count_nonzero() const
    {
        return static_cast<size_t>(std::count_if(data.begin(), data.end(),
                                                 [](uint8_t v) { return v != 0; }));
    }

    namespace utils
    {

        namespace
        {
            // Next whitespace-separated header token, skipping '#' comments
            bool read_header_token(std::istream &in, std::string &token)
            {
                token.clear();
                int c = in.get();
                while (c != EOF)
                {
                    if (c == '#')
                    {
                        while (c != EOF && c != '\n')
                            c = in.get();
                    }
                    else if (std::isspace(c))
                    {
                        if (!token.empty())
                            return true;
                    }
                    else
                    {
                        token.push_back(static_cast<char>(c));
                    }
                    c = in.get();
                }
                return !token.empty();
            }

            bool parse_uint(const std::string &s, uint32_t &out)
            {
                if (s.empty() || s.size() > 9)
                    return false;
                out = 0;
                for (char ch : s)
                {
                    if (!std::isdigit(static_cast<unsigned char>(ch)))
                        return false;
                    out = out * 10 + static_cast<uint32_t>(ch - '0');
                }
                return true;
            }
        } // namespace

        bool load_ppm(const std::string &path, Frame &frame)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                std::cerr << "[PPM] Failed to open: " << path << "\n";
                return false;
            }

            std::string magic, w_tok, h_tok, max_tok;
            if (!read_header_token(file, magic) || magic != "P6")
            {
                std::cerr << "[PPM] Not a binary PPM (P6): " << path << "\n";
                return false;
            }

            uint32_t w = 0, h = 0, maxval = 0;
            if (!read_header_token(file, w_tok) || !read_header_token(file, h_tok) ||
                !read_header_token(file, max_tok) ||
                !parse_uint(w_tok, w) || !parse_uint(h_tok, h) || !parse_uint(max_tok, maxval))
            {
                std::cerr << "[PPM] Malformed header: " << path << "\n";
                return false;
            }
            if (w == 0 || h == 0 || maxval != 255)
            {
                std::cerr << "[PPM] Unsupported dimensions or maxval in " << path
                          << " (" << w << "x" << h << ", maxval " << maxval << ")\n";
                return false;
            }

            Frame loaded = Frame::create(w, h, PixelFormat::RGB888);
            file.read(reinterpret_cast<char *>(loaded.data.data()),
                      static_cast<std::streamsize>(loaded.size));
            if (file.gcount() != static_cast<std::streamsize>(loaded.size))
            {
                std::cerr << "[PPM] Truncated pixel data: " << path << "\n";
                return false;
            }

            frame = std::move(loaded);
            return true;
        }

        bool save_ppm(const std::string &path, const Frame &frame)
        {
            if (!frame.is_valid())
            {
                std::cerr << "[PPM] Refusing to save invalid frame to " << path << "\n";
                return false;
            }

            std::ofstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                std::cerr << "[PPM] Failed to save to: " << path << "\n";
                return false;
            }

            file << "P6\n" << frame.width << " " << frame.height << "\n255\n";
            std::vector<uint8_t> row(static_cast<size_t>(frame.width) * 3);
            for (uint32_t y = 0; y < frame.height; y++)
            {
                for (uint32_t x = 0; x < frame.width; x++)
                {
                    frame.get_rgb(x, y, row[x * 3], row[x * 3 + 1], row[x * 3 + 2]);
                }
                file.write(reinterpret_cast<const char *>(row.data()),
                           static_cast<std::streamsize>(row.size()));
            }
            return static_cast<bool>(file);
        }

        bool save_pgm(const std::string &path, const Mask &mask)
        {
            if (mask.empty())
            {
                std::cerr << "[PPM] Refusing to save empty mask to " << path << "\n";
                return false;
            }

            std::ofstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                std::cerr << "[PPM] Failed to save to: " << path << "\n";
                return false;
            }

            file << "P5\n" << mask.width << " " << mask.height << "\n255\n";
            file.write(reinterpret_cast<const char *>(mask.data.data()),
                       static_cast<std::streamsize>(mask.data.size()));
            return static_cast<bool>(file);
        }

        Mask make_exclusion_mask(uint32_t width, uint32_t height,
                                 const std::vector<Rect> &excluded,
                                 int padding)
        {
            Mask mask(width, height, 255);

            for (const auto &r : excluded)
            {
                if (r.width <= 0 || r.height <= 0)
                    continue;

                const int x_start = std::max(0, r.x - padding);
                const int y_start = std::max(0, r.y - padding);
                const int x_end = std::min(static_cast<int>(width), r.x + r.width + padding);
                const int y_end = std::min(static_cast<int>(height), r.y + r.height + padding);

                for (int y = y_start; y < y_end; y++)
                {
                    for (int x = x_start; x < x_end; x++)
                    {
                        mask.at(x, y) = 0;
                    }
                }
            }

            return mask;
        }

    } // namespace utils

} // namespace camera
} // namespace handpose
