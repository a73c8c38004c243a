#include "window_scheduler.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace sluice {

namespace {

int next_scheduler_id() noexcept
{
    static std::atomic<int> id{0};
    return id++;
}

scheduler_settings validate(const scheduler_settings& settings)
{
    const auto s = settings.resolved();
    if(s.window_size < 1) {
        throw std::invalid_argument("window_size must be at least 1");
    }
    if(s.header_size < 0 || s.footer_size < 0 || s.possible_footer_size < 0) {
        throw std::invalid_argument("header and footer sizes must not be negative");
    }
    return s;
}

} // namespace

window_scheduler::window_scheduler(const piece_catalog& catalog, priority_sink& sink,
        const scheduler_settings& settings)
    : catalog_(catalog)
    , sink_(sink)
    , settings_(validate(settings))
    , id_(next_scheduler_id())
{
    const piece_range footer = catalog_.trailing_range(settings_.footer_size);
    footer_pieces_.reserve(footer.length());
    for(auto piece = footer.first; piece <= footer.last; ++piece) {
        footer_pieces_.push_back(piece);
    }
    possible_footer_range_ = catalog_.trailing_range(settings_.possible_footer_size);
    header_range_ = catalog_.leading_range(settings_.header_size);

    if(catalog_.empty()) {
        log(log::priority::normal, "INIT", "empty catalog, scheduler disabled");
        return;
    }

    window_start_ = catalog_.initial_piece_index();
    // the sum may not fit into piece_index_t with a huge window_size
    window_end_ = piece_index_t(std::min<int64_t>(
        int64_t(window_start_) + settings_.window_size - 1, catalog_.last_index()));
    active_pieces_.reserve(
        std::min(settings_.window_size, catalog_.num_pieces()) + footer_pieces_.size());
    for(auto piece = window_start_; piece <= window_end_; ++piece) {
        active_pieces_.push_back(piece);
    }

    log(log::priority::normal, "INIT",
        "%i pieces, window [%i, %i], footer %s, possible footer [%i, %i]",
        catalog_.num_pieces(), window_start_, window_end_,
        util::join(footer_pieces_).c_str(), possible_footer_range_.first,
        possible_footer_range_.last);
}

bool window_scheduler::is_downloading(const piece_index_t piece) const
{
    std::lock_guard<std::mutex> l(mutex_);
    if(!is_initialized_impl()) {
        return false;
    }
    check_index(piece, "is_downloading");
    return is_active(piece);
}

void window_scheduler::on_resumed()
{
    std::lock_guard<std::mutex> l(mutex_);
    if(!is_initialized_impl()) {
        return;
    }
    log(log::priority::normal, "RESUME", "resuming at piece %i",
        catalog_.initial_piece_index());
    seek(catalog_.initial_piece_index());
}

void window_scheduler::on_seek(const piece_index_t piece)
{
    std::lock_guard<std::mutex> l(mutex_);
    if(!is_initialized_impl()) {
        return;
    }
    check_index(piece, "on_seek");
    seek(piece);
}

void window_scheduler::seek(const piece_index_t piece)
{
    if(possible_footer_range_.contains(piece)) {
        // Players read the container index from the end of the file, which is not a
        // change of the playback position, so the window is preserved and only the
        // target piece is requested in addition to it.
        if(!is_active(piece)) {
            active_pieces_.insert(active_pieces_.begin(), piece);
        }
#ifdef SLUICE_ENABLE_LOGGING
        log(log::priority::low, "SEEK", "footer access at piece %i, active: %s", piece,
            util::join(active_pieces_).c_str());
#endif // SLUICE_ENABLE_LOGGING
        return;
    }

    active_pieces_.clear();
    fill_window(piece);
#ifdef SLUICE_ENABLE_LOGGING
    log(log::priority::normal, "SEEK", "seek to piece %i, window [%i, %i], active: %s",
        piece, window_start_, window_end_, util::join(active_pieces_).c_str());
#endif // SLUICE_ENABLE_LOGGING
    send_command();
}

void window_scheduler::on_piece_downloaded(const piece_index_t piece)
{
    std::lock_guard<std::mutex> l(mutex_);
    if(!is_initialized_impl()) {
        return;
    }
    check_index(piece, "on_piece_downloaded");

    auto it = std::find(active_pieces_.begin(), active_pieces_.end(), piece);
    if(it == active_pieces_.end()) {
        // not part of the window, doesn't concern us
        return;
    }
    active_pieces_.erase(it);

    // NOTE: the window is extended on the completion of any active piece, not just
    // the first one in the window.
    const auto next = find_next_pending_piece(window_end_ + 1);
    if((next != invalid_piece_index) && (next != window_end_)) {
        // a footer piece past the window may already be active
        if(!is_active(next)) {
            active_pieces_.push_back(next);
        }
        window_end_ = next;
    }

#ifdef SLUICE_ENABLE_LOGGING
    log(log::priority::low, "DOWNLOAD", "piece %i done, window [%i, %i], active: %s",
        piece, window_start_, window_end_, util::join(active_pieces_).c_str());
#endif // SLUICE_ENABLE_LOGGING
    send_command();
}

bool window_scheduler::is_initialized() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return is_initialized_impl();
}

piece_range window_scheduler::window() const
{
    std::lock_guard<std::mutex> l(mutex_);
    if(!is_initialized_impl()) {
        return {};
    }
    return {window_start_, window_end_};
}

std::vector<piece_index_t> window_scheduler::active_pieces() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return active_pieces_;
}

std::string window_scheduler::to_string() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return util::format("window[%i, %i] active%s footer%s", window_start_, window_end_,
        util::join(active_pieces_).c_str(), util::join(footer_pieces_).c_str());
}

bool window_scheduler::is_active(const piece_index_t piece) const noexcept
{
    return std::find(active_pieces_.begin(), active_pieces_.end(), piece)
        != active_pieces_.end();
}

void window_scheduler::check_index(
        const piece_index_t piece, const char* operation) const
{
    if(!catalog_.is_valid_index(piece)) {
        throw std::out_of_range(util::format("%s: piece %i is not in [0, %i]",
            operation, piece, catalog_.last_index()));
    }
}

piece_index_t window_scheduler::find_next_pending_piece(const piece_index_t start) const
{
    const auto last = catalog_.last_index();
    for(auto piece = start; piece <= last; ++piece) {
        if(!catalog_.is_finished(piece)) {
            return piece;
        }
    }
    return invalid_piece_index;
}

void window_scheduler::fill_window(const piece_index_t start)
{
    const auto first = find_next_pending_piece(start);
    if(first == invalid_piece_index) {
        // everything from start to the end of the file is downloaded, so there is
        // nothing to request
        return;
    }

    window_start_ = first;
    window_end_ = first;
    active_pieces_.push_back(first);
    for(auto i = 1; i < settings_.window_size; ++i) {
        const auto next = find_next_pending_piece(window_end_ + 1);
        if(next == invalid_piece_index) {
            break;
        }
        active_pieces_.push_back(next);
        window_end_ = next;
    }

    add_footer_pieces();
}

void window_scheduler::add_footer_pieces()
{
    for(const auto piece : footer_pieces_) {
        if(!catalog_.is_finished(piece) && !is_active(piece)) {
            active_pieces_.push_back(piece);
        }
    }
}

void window_scheduler::send_command()
{
    error_code error;
    sink_.download_only(active_pieces_, possible_footer_range_, error);
    if(error) {
        // the sink owns retrying, our state stays as it is
        log(log::priority::high, "SINK", "command rejected: %s",
            error.message().c_str());
    }
}

template <typename... Args>
void window_scheduler::log(const log::priority priority, const char* header,
        const char* format, Args&&... args) const
{
#ifdef SLUICE_ENABLE_LOGGING
    log::log_scheduler(id_, header, util::format(format, std::forward<Args>(args)...),
        priority);
#endif // SLUICE_ENABLE_LOGGING
}

} // namespace sluice
