#ifndef SLUICE_STREAM_SESSION_HEADER
#define SLUICE_STREAM_SESSION_HEADER

#include "download_stats.hpp"
#include "piece_catalog.hpp"
#include "piece_priority_table.hpp"
#include "settings.hpp"
#include "throughput_rate.hpp"
#include "types.hpp"
#include "window_scheduler.hpp"

#include <asio/io_context.hpp>

#include <cstdint>
#include <mutex>

namespace sluice {

/**
 * Streams a single file: binds the file's piece catalog, a priority table and a window
 * scheduler, and funnels the events of the transfer engine and the player onto a
 * single `io_context`, the network thread of the transfer engine.
 *
 * The event functions may be called from any thread. Arguments are validated on the
 * calling thread, so a piece index or offset that is not in the file throws
 * `std::out_of_range` right there (unless the file is empty, in which case they are
 * no-ops); the work itself is posted to the `io_context` and is done when it runs.
 *
 * The session must outlive the `io_context`'s processing of the posted handlers.
 */
class stream_session
{
    asio::io_context& ios_;

    // Piece states are written here by the transfer engine.
    piece_catalog& catalog_;

    piece_priority_table priority_table_;
    window_scheduler scheduler_;

    const int id_;

    // Fed with the size of each finished piece on the io_context, but read by stats()
    // on any thread.
    throughput_rate download_rate_;
    mutable std::mutex download_rate_mutex_;

public:

    /**
     * Pins the header pieces and sends the initial window to the priority table.
     * Throws `std::invalid_argument` on invalid settings.
     */
    stream_session(asio::io_context& ios, piece_catalog& catalog,
        const scheduler_settings& settings = {});

    stream_session(const stream_session&) = delete;
    stream_session& operator=(const stream_session&) = delete;

    /** Called by the transfer engine when `piece` has been downloaded and verified. */
    void piece_finished(const piece_index_t piece);

    /** Called by the transfer engine when downloading `piece` failed. */
    void piece_failed(const piece_index_t piece);

    /** Called by the player. `offset` is relative to the start of the file. */
    void seek_to_offset(const int64_t offset);
    void seek(const piece_index_t piece);
    void resume();

    int id() const noexcept { return id_; }

    piece_priority_table& priority_table() noexcept { return priority_table_; }
    const piece_priority_table& priority_table() const noexcept { return priority_table_; }
    const window_scheduler& scheduler() const noexcept { return scheduler_; }
    const piece_catalog& catalog() const noexcept { return catalog_; }

    /** Includes the download rate of the pieces finished through this session. */
    download_stats stats() const;

private:

    template <typename... Args>
    void log(const log::priority priority, const char* header, const char* format,
        Args&&... args) const;
};

} // namespace sluice

#endif // SLUICE_STREAM_SESSION_HEADER
