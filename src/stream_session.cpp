#include "stream_session.hpp"
#include "log.hpp"
#include "string_utils.hpp"

#include <asio/post.hpp>

#include <atomic>
#include <stdexcept>

namespace sluice {

namespace {

int next_session_id() noexcept
{
    static std::atomic<int> id{0};
    return id++;
}

} // namespace

stream_session::stream_session(asio::io_context& ios, piece_catalog& catalog,
        const scheduler_settings& settings)
    : ios_(ios)
    , catalog_(catalog)
    , priority_table_(catalog.num_pieces())
    , scheduler_(catalog_, priority_table_, settings)
    , id_(next_session_id())
{
    if(!scheduler_.is_initialized()) {
        log(log::priority::normal, "INIT", "empty file, nothing to stream");
        return;
    }

    // the metadata phase: the header is not the scheduler's business
    priority_table_.pin(scheduler_.header_range());

    error_code error;
    priority_table_.download_only(scheduler_.active_pieces(),
        scheduler_.possible_footer_range(), error);
    if(error) {
        log(log::priority::high, "INIT", "could not set initial priorities: %s",
            error.message().c_str());
    }
    log(log::priority::normal, "INIT", "streaming %lli bytes in %i pieces, %s",
        static_cast<long long>(catalog_.total_size()), catalog_.num_pieces(),
        scheduler_.to_string().c_str());
}

void stream_session::piece_finished(const piece_index_t piece)
{
    if(catalog_.empty()) {
        return;
    }
    // this validates the index and makes the state visible to the scheduler before it
    // gets to handle the event
    catalog_.set_state(piece, piece_state::finished);
    asio::post(ios_, [this, piece] {
        {
            std::lock_guard<std::mutex> l(download_rate_mutex_);
            download_rate_.update(catalog_[piece].size());
        }
        priority_table_.got(piece);
        scheduler_.on_piece_downloaded(piece);
    });
}

void stream_session::piece_failed(const piece_index_t piece)
{
    if(catalog_.empty()) {
        return;
    }
    catalog_.set_state(piece, piece_state::failed);
    asio::post(ios_, [this, piece] {
        log(log::priority::high, "DOWNLOAD", "piece %i failed", piece);
        // let it be picked again
        priority_table_.unreserve(piece);
    });
}

void stream_session::seek_to_offset(const int64_t offset)
{
    if(catalog_.empty()) {
        return;
    }
    const auto piece = catalog_.piece_at_offset(offset);
    log(log::priority::low, "SEEK", "offset %lli is in piece %i",
        static_cast<long long>(offset), piece);
    asio::post(ios_, [this, piece] { scheduler_.on_seek(piece); });
}

void stream_session::seek(const piece_index_t piece)
{
    if(catalog_.empty()) {
        return;
    }
    if(!catalog_.is_valid_index(piece)) {
        throw std::out_of_range(util::format("seek: piece %i is not in [0, %i]",
            piece, catalog_.last_index()));
    }
    asio::post(ios_, [this, piece] { scheduler_.on_seek(piece); });
}

void stream_session::resume()
{
    asio::post(ios_, [this] { scheduler_.on_resumed(); });
}

download_stats stream_session::stats() const
{
    auto stats = collect_download_stats(catalog_);
    std::lock_guard<std::mutex> l(download_rate_mutex_);
    stats.download_rate = download_rate_.rate();
    return stats;
}

template <typename... Args>
void stream_session::log(const log::priority priority, const char* header,
        const char* format, Args&&... args) const
{
#ifdef SLUICE_ENABLE_LOGGING
    log::log_session(id_, header, util::format(format, std::forward<Args>(args)...),
        priority);
#endif // SLUICE_ENABLE_LOGGING
}

} // namespace sluice
