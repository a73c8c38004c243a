#include "download_stats.hpp"
#include "piece_catalog.hpp"

#include <algorithm>

namespace sluice {

download_stats collect_download_stats(const piece_catalog& catalog)
{
    download_stats stats;
    stats.total_bytes = catalog.total_size();
    stats.num_pieces = catalog.num_pieces();
    for(const auto& piece : catalog) {
        switch(catalog.state(piece.index)) {
        case piece_state::finished:
            stats.downloaded_bytes += piece.size();
            ++stats.num_finished_pieces;
            break;
        case piece_state::failed:
            ++stats.num_failed_pieces;
            break;
        default:
            break;
        }
    }
    return stats;
}

int64_t contiguous_bytes_from(const piece_catalog& catalog, const int64_t offset)
{
    const auto first = catalog.piece_at_offset(offset);
    const int64_t position = catalog.data_start() + offset;
    int64_t num_bytes = 0;
    for(auto i = first; i <= catalog.last_index(); ++i) {
        if(!catalog.is_finished(i)) {
            break;
        }
        const auto& piece = catalog[i];
        // only count the part of the first piece from offset onwards
        num_bytes += piece.last_byte - std::max(piece.first_byte, position) + 1;
    }
    return num_bytes;
}

} // namespace sluice
