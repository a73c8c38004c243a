#ifndef SLUICE_PIECE_CATALOG_HEADER
#define SLUICE_PIECE_CATALOG_HEADER

#include "piece_range.hpp"
#include "types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace sluice {

enum class piece_state : uint8_t
{
    ready,
    downloading,
    finished,
    failed,
    not_available
};

/** Describes one piece of the streamed file. */
struct piece
{
    piece_index_t index;
    // Absolute byte offsets of the first and last byte covered by this piece, both
    // inclusive. Only the last piece may be shorter than the others.
    int64_t first_byte;
    int64_t last_byte;

    int64_t size() const noexcept { return last_byte - first_byte + 1; }
};

/**
 * The ordered list of pieces covering a single media file, built once per streaming
 * session.
 *
 * The layout (indices and byte ranges) is immutable. The completion state of each
 * piece is owned by the transfer engine, which publishes changes through
 * `set_state` from its own thread; readers (the scheduler) only ever load it. States
 * are atomics so that this needs no external synchronization.
 */
class piece_catalog
{
    std::vector<piece> pieces_;
    // Fully allocated to pieces_.size() on construction and never reallocated.
    std::unique_ptr<std::atomic<piece_state>[]> states_;

    int64_t total_size_ = 0;

    // The piece covering the position from which playback is to start.
    piece_index_t initial_piece_ = invalid_piece_index;

public:

    /** Creates an empty catalog. */
    piece_catalog() = default;

    /**
     * Indices must be dense and start at 0, and the pieces' byte ranges must be
     * contiguous and non-empty. Every piece starts out as `piece_state::ready`.
     * Throws `std::invalid_argument` if the list or `initial_piece` is malformed.
     */
    explicit piece_catalog(std::vector<piece> pieces, piece_index_t initial_piece = 0);

    /**
     * Builds the catalog of a file of `file_length` bytes split into pieces of
     * `piece_length` bytes (the last one may be shorter). `start_position` is the byte
     * offset within the file at which playback is to start and is clamped into the
     * file.
     */
    static piece_catalog from_layout(int64_t file_length, int piece_length,
        int64_t start_position = 0);

    piece_catalog(piece_catalog&&) = default;
    piece_catalog& operator=(piece_catalog&&) = default;

    bool empty() const noexcept { return pieces_.empty(); }
    int num_pieces() const noexcept { return pieces_.size(); }

    /** Both are `invalid_piece_index` when the catalog is empty. */
    piece_index_t first_index() const noexcept;
    piece_index_t last_index() const noexcept;
    piece_index_t initial_piece_index() const noexcept { return initial_piece_; }

    int64_t total_size() const noexcept { return total_size_; }

    /** The absolute offset of the first byte of the first piece. */
    int64_t data_start() const noexcept;

    bool is_valid_index(const piece_index_t index) const noexcept
    {
        return (index >= 0) && (index < num_pieces());
    }

    /** Throws `std::out_of_range` if `index` is not in the catalog. */
    const piece& at(const piece_index_t index) const;
    const piece& operator[](const piece_index_t index) const noexcept
    {
        return pieces_[index];
    }

    piece_state state(const piece_index_t index) const;
    void set_state(const piece_index_t index, const piece_state state);
    bool is_finished(const piece_index_t index) const
    {
        return state(index) == piece_state::finished;
    }

    /**
     * Returns the piece that covers the byte at `offset`, which is relative to the
     * start of the file (i.e. to `data_start()`). Throws `std::out_of_range` if the
     * offset is not within the file.
     */
    piece_index_t piece_at_offset(const int64_t offset) const;

    /** The pieces that overlap the first `num_bytes` bytes of the file. */
    piece_range leading_range(const int64_t num_bytes) const noexcept;

    /**
     * The pieces whose last byte lies within the last `num_bytes` bytes of the file.
     * This is what is considered the footer: container metadata at the end of a
     * media file.
     */
    piece_range trailing_range(const int64_t num_bytes) const noexcept;

    std::vector<piece>::const_iterator begin() const noexcept { return pieces_.begin(); }
    std::vector<piece>::const_iterator end() const noexcept { return pieces_.end(); }

private:

    void check_index(const piece_index_t index) const;
};

inline piece_index_t piece_catalog::first_index() const noexcept
{
    return empty() ? invalid_piece_index : pieces_.front().index;
}

inline piece_index_t piece_catalog::last_index() const noexcept
{
    return empty() ? invalid_piece_index : pieces_.back().index;
}

inline int64_t piece_catalog::data_start() const noexcept
{
    return empty() ? 0 : pieces_.front().first_byte;
}

} // namespace sluice

#endif // SLUICE_PIECE_CATALOG_HEADER
