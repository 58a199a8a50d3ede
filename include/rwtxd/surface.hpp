#ifndef RWTXD_SURFACE_HPP_
#define RWTXD_SURFACE_HPP_

#include <rwtxd/rwtxd_export.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rwtxd {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract destination for decoded texels.
 * Pixel decoders always produce RGBA8 rows, top to bottom.
 *
 * Implement this interface to upload straight into a framework texture
 * (preview widgets, engine importers) without an intermediate copy.
 */
class RWTXD_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions.
     * Called before any pixel writes.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height) = 0;

    /**
     * Write a horizontal run of RGBA8 pixels.
     *
     * NOTE: The x parameter is a BYTE OFFSET within the row (pixel_x * 4).
     *
     * @param x Starting byte offset within the row
     * @param y Row number
     * @param count Number of bytes to write
     * @param pixels Pointer to pixel data
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;
};

// ============================================================================
// RGBA Surface (default implementation)
// ============================================================================

/**
 * In-memory surface holding a tightly packed RGBA8 buffer.
 */
class RWTXD_EXPORT rgba_surface : public surface {
public:
    rgba_surface() = default;
    ~rgba_surface() override = default;

    rgba_surface(const rgba_surface&) = delete;
    rgba_surface& operator=(const rgba_surface&) = delete;
    rgba_surface(rgba_surface&&) noexcept = default;
    rgba_surface& operator=(rgba_surface&&) noexcept = default;

    bool set_size(int width, int height) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<std::uint8_t> mutable_pixels() noexcept { return pixels_; }

    // Move the pixel buffer out, leaving the surface empty.
    [[nodiscard]] std::vector<std::uint8_t> release() noexcept;

private:
    std::vector<std::uint8_t> pixels_;
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
};

} // namespace rwtxd

#endif // RWTXD_SURFACE_HPP_
