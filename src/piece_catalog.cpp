#include "piece_catalog.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace sluice {

piece_catalog::piece_catalog(std::vector<piece> pieces, piece_index_t initial_piece)
    : pieces_(std::move(pieces))
{
    if(pieces_.empty()) {
        return;
    }

    for(auto i = 0; i < num_pieces(); ++i) {
        const auto& p = pieces_[i];
        if(p.index != i) {
            throw std::invalid_argument(util::format(
                "piece at position %i has index %i, indices must be dense", i, p.index));
        }
        if(p.last_byte < p.first_byte) {
            throw std::invalid_argument(util::format("piece %i is empty", i));
        }
        if((i > 0) && (p.first_byte != pieces_[i - 1].last_byte + 1)) {
            throw std::invalid_argument(util::format(
                "piece %i does not start where piece %i ends", i, i - 1));
        }
        total_size_ += p.size();
    }

    if(!is_valid_index(initial_piece)) {
        throw std::invalid_argument(util::format(
            "initial piece %i is not in [0, %i]", initial_piece, last_index()));
    }
    initial_piece_ = initial_piece;

    states_.reset(new std::atomic<piece_state>[pieces_.size()]);
    for(auto i = 0; i < num_pieces(); ++i) {
        states_[i].store(piece_state::ready, std::memory_order_relaxed);
    }
}

piece_catalog piece_catalog::from_layout(const int64_t file_length,
        const int piece_length, int64_t start_position)
{
    if(file_length < 0) {
        throw std::invalid_argument("file length must not be negative");
    }
    if(piece_length <= 0) {
        throw std::invalid_argument("piece length must be positive");
    }
    if(file_length == 0) {
        return piece_catalog();
    }

    const int64_t num_pieces = (file_length + piece_length - 1) / piece_length;
    std::vector<piece> pieces;
    pieces.reserve(num_pieces);
    for(int64_t i = 0; i < num_pieces; ++i) {
        const int64_t first = i * piece_length;
        const int64_t last = std::min(first + piece_length, file_length) - 1;
        pieces.push_back(piece{piece_index_t(i), first, last});
    }

    start_position = std::max<int64_t>(0, std::min(start_position, file_length - 1));
    return piece_catalog(std::move(pieces), piece_index_t(start_position / piece_length));
}

const piece& piece_catalog::at(const piece_index_t index) const
{
    check_index(index);
    return pieces_[index];
}

piece_state piece_catalog::state(const piece_index_t index) const
{
    check_index(index);
    return states_[index].load(std::memory_order_acquire);
}

void piece_catalog::set_state(const piece_index_t index, const piece_state state)
{
    check_index(index);
    states_[index].store(state, std::memory_order_release);
}

piece_index_t piece_catalog::piece_at_offset(const int64_t offset) const
{
    if((offset < 0) || (offset >= total_size_)) {
        throw std::out_of_range(util::format("offset %lli is not in file of %lli bytes",
            static_cast<long long>(offset), static_cast<long long>(total_size_)));
    }
    const int64_t absolute = data_start() + offset;
    // the first piece whose last byte is at or after the offset covers it
    const auto it = std::lower_bound(pieces_.begin(), pieces_.end(), absolute,
        [](const piece& p, const int64_t pos) { return p.last_byte < pos; });
    return it->index;
}

piece_range piece_catalog::leading_range(const int64_t num_bytes) const noexcept
{
    if(empty() || (num_bytes <= 0)) {
        return {};
    }
    // the zone can't be larger than the file, and data_start() + num_bytes could
    // overflow otherwise
    const int64_t end = data_start() + std::min(num_bytes, total_size_);
    const auto it = std::lower_bound(pieces_.begin(), pieces_.end(), end,
        [](const piece& p, const int64_t pos) { return p.first_byte < pos; });
    // it is the first piece that starts at or after end, so it's not included
    if(it == pieces_.begin()) {
        return {};
    }
    return {0, std::prev(it)->index};
}

piece_range piece_catalog::trailing_range(const int64_t num_bytes) const noexcept
{
    if(empty() || (num_bytes <= 0)) {
        return {};
    }
    const int64_t begin = data_start() + total_size_
        - std::min(num_bytes, total_size_);
    const auto it = std::lower_bound(pieces_.begin(), pieces_.end(), begin,
        [](const piece& p, const int64_t pos) { return p.last_byte < pos; });
    if(it == pieces_.end()) {
        return {};
    }
    return {it->index, last_index()};
}

void piece_catalog::check_index(const piece_index_t index) const
{
    if(!is_valid_index(index)) {
        throw std::out_of_range(util::format(
            "piece %i is not in catalog of %i pieces", index, num_pieces()));
    }
}

} // namespace sluice
