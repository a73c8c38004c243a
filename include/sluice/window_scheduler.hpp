#ifndef SLUICE_WINDOW_SCHEDULER_HEADER
#define SLUICE_WINDOW_SCHEDULER_HEADER

#include "log.hpp"
#include "piece_catalog.hpp"
#include "piece_range.hpp"
#include "priority_sink.hpp"
#include "settings.hpp"
#include "types.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace sluice {

/**
 * Decides which pieces of a streamed file the transfer engine should download next.
 *
 * The scheduler maintains an index window of at most `window_size` pieces, starting
 * at the playback position, and a set of active pieces, which is what is handed to
 * the priority sink. Handing the engine only a few pieces at a time keeps it focused
 * on the data the player needs next, as otherwise it would optimize for overall
 * throughput and the pieces about to be played would arrive late.
 *
 * Example: 10 pieces, window size 3, window is [3, 5]:
 *
 * 0, 1, 2, 3, 4, 5, 6, 7, 8, 9
 *          |-----|
 *
 * When any active piece completes, it is removed from the active set and the window
 * is extended by the next unfinished piece after its end:
 *
 * 0, 1, 2, 3, 4, 5, 6, 7, 8, 9
 *          |--------|         (4 completed, active pieces: 3, 5, 6)
 *
 * Seeking rebuilds the window at the target piece, skipping pieces that are already
 * downloaded, and always includes the unfinished pieces of the footer, where media
 * containers often keep their index. Seeking into the trailing `possible_footer_size`
 * bytes is considered a footer access, in which case the target is merely added to
 * the active set and the window is kept.
 *
 * Pieces of the header (the first `header_size` bytes) are not requested by the
 * scheduler; see `header_range()`.
 *
 * All public functions are thread-safe: they are serialized by a single mutex, and
 * the call to the sink is made before the mutex is released, so the sink observes
 * commands in the order the events were serialized.
 *
 * Every function that takes a piece index throws `std::out_of_range` if the index is
 * not in the catalog, unless the catalog is empty, in which case every function is
 * a no-op.
 */
class window_scheduler
{
    // Only piece states are read from the catalog, which the transfer engine may
    // update concurrently.
    const piece_catalog& catalog_;
    priority_sink& sink_;
    const scheduler_settings settings_;

    // These are computed once on construction from the catalog's byte layout.
    std::vector<piece_index_t> footer_pieces_;
    piece_range possible_footer_range_;
    piece_range header_range_;

    // The inclusive bounds of the window. window_end_ is -1 if the catalog is empty,
    // which is used as the "not initialized" sentinel.
    piece_index_t window_start_ = invalid_piece_index;
    piece_index_t window_end_ = invalid_piece_index;

    // The pieces currently requested from the sink, without duplicates. It's usually
    // sorted by index, but pieces of a footer access are put at the front, and
    // footer pieces are appended to the window.
    std::vector<piece_index_t> active_pieces_;

    // Used to tell apart the log lines of concurrently streamed files.
    const int id_;

    mutable std::mutex mutex_;

public:

    /**
     * Neither `catalog` nor `sink` is owned and both must outlive the scheduler.
     * Construction computes the initial window but does not issue a command to the
     * sink.
     *
     * Throws `std::invalid_argument` if `settings.window_size` is less than 1 or if
     * any of the byte thresholds is negative.
     */
    window_scheduler(const piece_catalog& catalog, priority_sink& sink,
        const scheduler_settings& settings = {});

    /** Returns whether `piece` is currently requested from the sink. */
    bool is_downloading(const piece_index_t piece) const;

    /** Restarts the window at the catalog's initial piece. */
    void on_resumed();

    /** Called when the player seeks to a position within `piece`. */
    void on_seek(const piece_index_t piece);

    /**
     * Must be called by the transfer engine after `piece` has been downloaded (and
     * after its state in the catalog has been set to `piece_state::finished`).
     */
    void on_piece_downloaded(const piece_index_t piece);

    /** Whether the catalog has any pieces, i.e. whether the scheduler does anything. */
    bool is_initialized() const;

    /** The current window bounds, empty if not initialized. */
    piece_range window() const;
    std::vector<piece_index_t> active_pieces() const;

    const std::vector<piece_index_t>& footer_pieces() const noexcept;
    const piece_range& possible_footer_range() const noexcept;

    /**
     * The pieces making up the first `header_size` bytes of the file. These are not
     * requested by the scheduler; they are exposed so that the component in charge
     * of downloading container metadata (e.g. by pinning them in the priority table)
     * need not duplicate the catalog maths.
     */
    const piece_range& header_range() const noexcept;

    const scheduler_settings& settings() const noexcept;

    /** Returns a human readable dump of the window and active pieces for debugging. */
    std::string to_string() const;

private:

    bool is_initialized_impl() const noexcept { return window_end_ != invalid_piece_index; }
    bool is_active(const piece_index_t piece) const noexcept;
    void check_index(const piece_index_t piece, const char* operation) const;

    void seek(const piece_index_t piece);

    /**
     * Returns the first piece at or after `start` that is not yet finished, or
     * `invalid_piece_index` if all of them are.
     */
    piece_index_t find_next_pending_piece(const piece_index_t start) const;

    /**
     * Rebuilds the window and the active set starting at the first unfinished piece
     * at or after `start`, and adds the footer. active_pieces_ must be empty.
     */
    void fill_window(const piece_index_t start);
    void add_footer_pieces();

    void send_command();

    template <typename... Args>
    void log(const log::priority priority, const char* header, const char* format,
        Args&&... args) const;
};

inline const std::vector<piece_index_t>& window_scheduler::footer_pieces() const noexcept
{
    return footer_pieces_;
}

inline const piece_range& window_scheduler::possible_footer_range() const noexcept
{
    return possible_footer_range_;
}

inline const piece_range& window_scheduler::header_range() const noexcept
{
    return header_range_;
}

inline const scheduler_settings& window_scheduler::settings() const noexcept
{
    return settings_;
}

} // namespace sluice

#endif // SLUICE_WINDOW_SCHEDULER_HEADER
