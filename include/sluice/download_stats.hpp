#ifndef SLUICE_DOWNLOAD_STATS_HEADER
#define SLUICE_DOWNLOAD_STATS_HEADER

#include <cstdint>

namespace sluice {

class piece_catalog;

/** A snapshot of a streamed file's download progress. */
struct download_stats
{
    // The sum of all piece sizes and of the finished ones.
    int64_t total_bytes = 0;
    int64_t downloaded_bytes = 0;

    // Bytes per second of verified pieces. Only a `stream_session` measures it, it's
    // always 0 when collected directly from a catalog.
    int64_t download_rate = 0;

    int num_pieces = 0;
    int num_finished_pieces = 0;
    int num_failed_pieces = 0;

    /** In [0, 1]. An empty file is considered complete. */
    double progress() const noexcept
    {
        return total_bytes == 0 ? 1.0 : double(downloaded_bytes) / total_bytes;
    }

    bool is_finished() const noexcept { return num_finished_pieces == num_pieces; }
};

/** Piece states may change while this runs, so the result is only a snapshot. */
download_stats collect_download_stats(const piece_catalog& catalog);

/**
 * Returns the number of bytes that are downloaded contiguously from `offset`, which
 * is relative to the start of the file, i.e. how much the player can read from that
 * position without stalling. Throws `std::out_of_range` if `offset` is not within the
 * file.
 */
int64_t contiguous_bytes_from(const piece_catalog& catalog, const int64_t offset);

} // namespace sluice

#endif // SLUICE_DOWNLOAD_STATS_HEADER
