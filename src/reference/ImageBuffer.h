// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

// Row-major image with row 0 at the bottom.
template <typename T>
class ImageBuffer {
public:
    ImageBuffer() = default;
    ImageBuffer(int width, int height, const T& value = T {})
        : m_width(width)
        , m_height(height)
        , m_pixels(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), value)
    {
    }

    [[nodiscard]] int width() const { return m_width; }
    [[nodiscard]] int height() const { return m_height; }

    T& at(int x, int y) { return m_pixels[index(x, y)]; }
    const T& at(int x, int y) const { return m_pixels[index(x, y)]; }

    void fill(const T& value) { std::fill(m_pixels.begin(), m_pixels.end(), value); }

    [[nodiscard]] const std::vector<T>& pixels() const { return m_pixels; }

private:
    [[nodiscard]] std::size_t index(int x, int y) const
    {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(x);
    }

    int m_width { 0 };
    int m_height { 0 };
    std::vector<T> m_pixels;
};
