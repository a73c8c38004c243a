#ifndef SLUICE_TYPES_HEADER
#define SLUICE_TYPES_HEADER

#include <cstdint>

namespace sluice {

// Piece indices are dense and zero-based, and match the transfer engine's own piece
// numbering so that they can be handed to it without translation.
using piece_index_t = int32_t;

static constexpr piece_index_t invalid_piece_index = -1;

} // namespace sluice

#endif // SLUICE_TYPES_HEADER
