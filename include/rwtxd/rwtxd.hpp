#ifndef RWTXD_RWTXD_HPP_
#define RWTXD_RWTXD_HPP_

#include <rwtxd/rwtxd_export.h>
#include <rwtxd/types.hpp>
#include <rwtxd/surface.hpp>
#include <rwtxd/version.hpp>
#include <rwtxd/chunk.hpp>
#include <rwtxd/chunk_walker.hpp>
#include <rwtxd/texture_info.hpp>
#include <rwtxd/texture_native.hpp>
#include <rwtxd/txd_archive.hpp>
#include <rwtxd/codecs/uncompressed.hpp>
#include <rwtxd/codecs/paletted.hpp>
#include <rwtxd/codecs/block.hpp>

namespace rwtxd {

// All public API is included via the headers above.
// See:
//   - types.hpp:          texture_format, raster_encoding, txd_error, txd_result, load_options
//   - surface.hpp:        surface interface, rgba_surface
//   - version.hpp:        RenderWare library id decoding
//   - chunk.hpp:          section headers and type ids
//   - chunk_walker.hpp:   structured / scanning walk of a dictionary
//   - texture_info.hpp:   per-texture metadata, size calculation, to_rgba()
//   - texture_native.hpp: TEXTURENATIVE parser, format classification
//   - txd_archive.hpp:    archive model, load / save
//   - codecs/*.hpp:       pixel decoders

} // namespace rwtxd

#endif // RWTXD_RWTXD_HPP_
