#include "piece_priority_table.hpp"
#include "log.hpp"
#include "priority_error.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sluice {

piece_priority_table::piece_priority_table(const int num_pieces)
    : pieces_(std::max(num_pieces, 0))
{}

void piece_priority_table::download_only(const std::vector<piece_index_t>& pieces,
        const piece_range& possible_footer, error_code& error)
{
    error.clear();
    std::lock_guard<std::mutex> l(mutex_);

    if(pieces_.empty()) {
        error = make_error_code(priority_errc::empty_table);
        return;
    }
    // possible_footer is computed from the same catalog as the pieces, so if it
    // reaches past the table, the command is for a different file
    if(!possible_footer.empty()
            && ((possible_footer.first < 0) || (possible_footer.last >= num_pieces()))) {
        error = make_error_code(priority_errc::piece_count_mismatch);
        return;
    }
    const auto invalid = std::find_if(pieces.begin(), pieces.end(),
        [this](const piece_index_t p) { return (p < 0) || (p >= num_pieces()); });
    if(invalid != pieces.end()) {
        log(log::priority::high, "COMMAND", "rejected, invalid piece %i", *invalid);
        error = make_error_code(priority_errc::invalid_piece_index);
        return;
    }

    std::vector<bool> is_listed(pieces_.size(), false);
    for(const auto p : pieces) {
        is_listed[p] = true;
    }

    for(piece_index_t i = 0; i < num_pieces(); ++i) {
        auto& entry = pieces_[i];
        if(entry.have) {
            entry.priority = piece_priority::ignore;
        } else if(is_listed[i] || pinned_pieces_.contains(i)) {
            entry.priority = piece_priority::top;
        } else if(possible_footer.contains(i) && (entry.priority != piece_priority::ignore)) {
            entry.priority = piece_priority::normal;
        } else {
            entry.priority = piece_priority::ignore;
        }
    }

    wanted_pieces_.clear();
    for(const auto p : pieces) {
        if(!pieces_[p].have) {
            wanted_pieces_.push_back(p);
        }
    }
    ++num_commands_;

#ifdef SLUICE_ENABLE_LOGGING
    log(log::priority::low, "COMMAND", "#%i download only %s", num_commands_,
        util::join(wanted_pieces_).c_str());
#endif // SLUICE_ENABLE_LOGGING
}

void piece_priority_table::pin(const piece_range& pieces)
{
    std::lock_guard<std::mutex> l(mutex_);
    if(!pieces.empty()) {
        check_index(pieces.first);
        check_index(pieces.last);
    }
    pinned_pieces_ = pieces;
    for(auto i = pieces.first; i <= pieces.last; ++i) {
        if(!pieces_[i].have) {
            pieces_[i].priority = piece_priority::top;
        }
    }
    log(log::priority::low, "PIN", "pinned [%i, %i]", pieces.first, pieces.last);
}

void piece_priority_table::unpin()
{
    std::lock_guard<std::mutex> l(mutex_);
    // the pieces keep their priority until the next command
    pinned_pieces_ = piece_range();
}

piece_index_t piece_priority_table::pick()
{
    std::lock_guard<std::mutex> l(mutex_);

    const auto can_pick = [this](const piece_index_t p)
    {
        const auto& entry = pieces_[p];
        return !entry.have && !entry.is_reserved
            && (entry.priority != piece_priority::ignore);
    };

    piece_index_t picked = invalid_piece_index;
    for(auto i = pinned_pieces_.first; i <= pinned_pieces_.last; ++i) {
        if(can_pick(i)) {
            picked = i;
            break;
        }
    }
    if(picked == invalid_piece_index) {
        const auto it = std::find_if(wanted_pieces_.begin(), wanted_pieces_.end(),
            can_pick);
        if(it != wanted_pieces_.end()) {
            picked = *it;
        }
    }
    if(picked == invalid_piece_index) {
        for(piece_index_t i = 0; i < num_pieces(); ++i) {
            if(can_pick(i) && (pieces_[i].priority == piece_priority::normal)) {
                picked = i;
                break;
            }
        }
    }

    if(picked != invalid_piece_index) {
        pieces_[picked].is_reserved = true;
    }
    return picked;
}

void piece_priority_table::reserve(const piece_index_t piece)
{
    std::lock_guard<std::mutex> l(mutex_);
    check_index(piece);
    pieces_[piece].is_reserved = true;
}

void piece_priority_table::unreserve(const piece_index_t piece)
{
    std::lock_guard<std::mutex> l(mutex_);
    check_index(piece);
    pieces_[piece].is_reserved = false;
}

void piece_priority_table::got(const piece_index_t piece)
{
    std::lock_guard<std::mutex> l(mutex_);
    check_index(piece);
    auto& entry = pieces_[piece];
    if(entry.have) {
        return;
    }
    entry.have = true;
    entry.is_reserved = false;
    entry.priority = piece_priority::ignore;
    ++num_have_pieces_;
    remove_wanted(piece);
}

void piece_priority_table::lost(const piece_index_t piece)
{
    std::lock_guard<std::mutex> l(mutex_);
    check_index(piece);
    auto& entry = pieces_[piece];
    if(!entry.have) {
        return;
    }
    entry.have = false;
    --num_have_pieces_;
    // we need to download this piece again, but whether it's wanted now is for the
    // next command to decide, unless it's pinned
    entry.priority = pinned_pieces_.contains(piece) ? piece_priority::top
                                                   : piece_priority::normal;
    log(log::priority::normal, "LOST", "piece %i lost", piece);
}

piece_priority piece_priority_table::priority(const piece_index_t piece) const
{
    std::lock_guard<std::mutex> l(mutex_);
    check_index(piece);
    return pieces_[piece].priority;
}

bool piece_priority_table::is_reserved(const piece_index_t piece) const
{
    std::lock_guard<std::mutex> l(mutex_);
    check_index(piece);
    return pieces_[piece].is_reserved;
}

bool piece_priority_table::has(const piece_index_t piece) const
{
    std::lock_guard<std::mutex> l(mutex_);
    check_index(piece);
    return pieces_[piece].have;
}

int piece_priority_table::num_have_pieces() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return num_have_pieces_;
}

bool piece_priority_table::has_all_pieces() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return num_have_pieces_ == num_pieces();
}

std::vector<piece_index_t> piece_priority_table::wanted_pieces() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return wanted_pieces_;
}

piece_range piece_priority_table::pinned_pieces() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return pinned_pieces_;
}

int piece_priority_table::num_commands() const
{
    std::lock_guard<std::mutex> l(mutex_);
    return num_commands_;
}

std::string piece_priority_table::to_string() const
{
    std::lock_guard<std::mutex> l(mutex_);
    std::ostringstream ss;
    for(piece_index_t i = 0; i < num_pieces(); ++i) {
        const auto& entry = pieces_[i];
        ss << "p(" << i
           << '|' << int(entry.priority)
           << '|' << (entry.is_reserved ? 'R' : '0')
           << '|' << (entry.have ? 'H' : '0')
           << ") ";
    }
    return ss.str();
}

void piece_priority_table::check_index(const piece_index_t piece) const
{
    if((piece < 0) || (piece >= num_pieces())) {
        throw std::out_of_range(util::format(
            "piece %i is not in priority table of %i pieces", piece, num_pieces()));
    }
}

void piece_priority_table::remove_wanted(const piece_index_t piece)
{
    const auto it = std::find(wanted_pieces_.begin(), wanted_pieces_.end(), piece);
    if(it != wanted_pieces_.end()) {
        wanted_pieces_.erase(it);
    }
}

template <typename... Args>
void piece_priority_table::log(const log::priority priority, const char* header,
        const char* format, Args&&... args) const
{
#ifdef SLUICE_ENABLE_LOGGING
    log::log_priority_table(header, util::format(format, std::forward<Args>(args)...),
        priority);
#endif // SLUICE_ENABLE_LOGGING
}

} // namespace sluice
