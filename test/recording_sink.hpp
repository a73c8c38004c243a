#ifndef SLUICE_TEST_RECORDING_SINK_HEADER
#define SLUICE_TEST_RECORDING_SINK_HEADER

#include "piece_catalog.hpp"
#include "priority_error.hpp"
#include "priority_sink.hpp"

#include "gmock/gmock.h"

#include <vector>

namespace sluice {

// Remembers every command it receives. Only ever called under the scheduler's lock.
class recording_sink : public priority_sink
{
public:
    struct command
    {
        std::vector<piece_index_t> pieces;
        piece_range possible_footer;
    };

    std::vector<command> commands;

    void download_only(const std::vector<piece_index_t>& pieces,
        const piece_range& possible_footer, error_code& error) override
    {
        error.clear();
        commands.push_back({pieces, possible_footer});
    }

    const command& last() const { return commands.back(); }
};

class mock_sink : public priority_sink
{
public:
    MOCK_METHOD(void, download_only, (const std::vector<piece_index_t>& pieces,
        const piece_range& possible_footer, error_code& error), (override));
};

// Marks the piece downloaded the way a transfer engine would: state first, then event.
template <typename Scheduler>
void finish(piece_catalog& catalog, Scheduler& scheduler, const piece_index_t piece)
{
    catalog.set_state(piece, piece_state::finished);
    scheduler.on_piece_downloaded(piece);
}

} // namespace sluice

#endif // SLUICE_TEST_RECORDING_SINK_HEADER
