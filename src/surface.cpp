#include <rwtxd/surface.hpp>

#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>
#include <utility>

namespace rwtxd {

namespace {

// Raster width and height are stored as u16
constexpr int MAX_DIMENSION = 0xFFFF;
constexpr std::size_t BYTES_PER_TEXEL = 4;

} // namespace

bool rgba_surface::set_size(int width, int height) {
    if (width <= 0 || height <= 0 || width > MAX_DIMENSION || height > MAX_DIMENSION) {
        return false;
    }

    // At most 65535 * 65535 * 4 bytes, which fits a 64-bit size_t
    const std::size_t pitch = static_cast<std::size_t>(width) * BYTES_PER_TEXEL;
    try {
        pixels_.assign(pitch * static_cast<std::size_t>(height), 0);
    } catch (const std::bad_alloc&) {
        return false;
    } catch (const std::length_error&) {
        return false;
    }

    width_ = width;
    height_ = height;
    pitch_ = pitch;
    return true;
}

void rgba_surface::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (!pixels || count <= 0 || x < 0 || y < 0 || y >= height_) {
        return;
    }

    const std::size_t start = static_cast<std::size_t>(x);
    if (start >= pitch_) {
        return;
    }

    // Clip the run to the end of its row
    const std::size_t length = std::min(static_cast<std::size_t>(count), pitch_ - start);
    std::uint8_t* row = pixels_.data() + static_cast<std::size_t>(y) * pitch_;
    std::memcpy(row + start, pixels, length);
}

std::vector<std::uint8_t> rgba_surface::release() noexcept {
    width_ = 0;
    height_ = 0;
    pitch_ = 0;
    return std::exchange(pixels_, {});
}

} // namespace rwtxd
