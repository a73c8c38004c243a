#ifndef SLUICE_PIECE_PRIORITY_TABLE_HEADER
#define SLUICE_PIECE_PRIORITY_TABLE_HEADER

#include "log.hpp"
#include "piece_range.hpp"
#include "priority_sink.hpp"
#include "types.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace sluice {

/** The values match the levels most transfer engines use for piece priorities. */
enum class piece_priority : uint8_t
{
    ignore = 0,
    normal = 4,
    top = 7
};

/**
 * An in-memory per-piece priority table that the transfer engine consults when it
 * picks the next piece to request. It implements `priority_sink`, so a
 * `window_scheduler` can drive it directly.
 *
 * Besides the scheduler's commands, a range of pieces may be pinned: these stay at
 * top priority until they are downloaded, whatever the commands say. This is how the
 * header (the container metadata at the beginning of the file) is kept from being
 * starved by the sequential window.
 *
 * All functions are thread-safe.
 */
class piece_priority_table final : public priority_sink
{
    struct piece
    {
        piece_priority priority = piece_priority::normal;
        bool have = false;
        bool is_reserved = false;
    };

    // All pieces, indexed by piece index.
    std::vector<piece> pieces_;

    // The pieces listed in the last command, in the order they were listed, which is
    // the order in which they are picked. As soon as we get a piece, it is removed
    // from here.
    std::vector<piece_index_t> wanted_pieces_;

    piece_range pinned_pieces_;

    int num_have_pieces_ = 0;
    int num_commands_ = 0;

    mutable std::mutex mutex_;

public:

    /** All pieces start out with normal priority. */
    explicit piece_priority_table(int num_pieces);

    /**
     * Listed pieces are set to top priority, all others not pinned are ignored,
     * except for pieces in `possible_footer` that aren't ignored yet, which are set
     * to normal priority rather than demoted.
     *
     * The command is rejected and nothing changes if any listed piece is not in the
     * table (`priority_errc::invalid_piece_index`), if `possible_footer` extends past
     * the table (`priority_errc::piece_count_mismatch`) or if the table is empty
     * (`priority_errc::empty_table`).
     */
    void download_only(const std::vector<piece_index_t>& pieces,
        const piece_range& possible_footer, error_code& error) override;

    /**
     * Keeps `pieces` at top priority until they are downloaded. Replaces the previous
     * pinned range. Throws `std::out_of_range` if the range is not in the table.
     */
    void pin(const piece_range& pieces);
    void unpin();

    /**
     * Picks and reserves the next piece to download: pinned pieces first, in index
     * order, then the pieces of the last command in the order they were listed, then
     * any remaining normal priority piece in index order. Returns
     * `invalid_piece_index` if there is nothing to download.
     */
    piece_index_t pick();

    void reserve(const piece_index_t piece);

    /**
     * Called when the engine decides not to download the piece it has reserved using
     * pick() or when the download failed, so that it can be picked again.
     */
    void unreserve(const piece_index_t piece);

    /** Called when the piece has been downloaded and verified. */
    void got(const piece_index_t piece);

    /** Should be called when our saved piece got erased. */
    void lost(const piece_index_t piece);

    /** Throws `std::out_of_range` if `piece` is not in the table. */
    piece_priority priority(const piece_index_t piece) const;
    bool is_reserved(const piece_index_t piece) const;
    bool has(const piece_index_t piece) const;

    int num_pieces() const noexcept;
    int num_have_pieces() const;
    bool has_all_pieces() const;

    std::vector<piece_index_t> wanted_pieces() const;
    piece_range pinned_pieces() const;

    /** The number of commands applied, rejected ones excluded. */
    int num_commands() const;

    /**
     * Used only for debugging, returns a beautified string of the pieces with their
     * priorities and reservation states.
     */
    std::string to_string() const;

private:

    void check_index(const piece_index_t piece) const;
    void remove_wanted(const piece_index_t piece);

    template <typename... Args>
    void log(const log::priority priority, const char* header, const char* format,
        Args&&... args) const;
};

inline int piece_priority_table::num_pieces() const noexcept
{
    return pieces_.size();
}

} // namespace sluice

#endif // SLUICE_PIECE_PRIORITY_TABLE_HEADER
