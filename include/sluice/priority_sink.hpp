#ifndef SLUICE_PRIORITY_SINK_HEADER
#define SLUICE_PRIORITY_SINK_HEADER

#include "error_code.hpp"
#include "piece_range.hpp"
#include "types.hpp"

#include <vector>

namespace sluice {

/**
 * The collaborator through which the scheduler tells the transfer engine which pieces
 * it wants. It is invoked while the scheduler holds its lock, so implementations must
 * be fast and must not block (e.g. by doing network I/O): they are expected to update
 * an in-memory priority table.
 */
class priority_sink
{
public:
    virtual ~priority_sink() = default;

    /**
     * Exactly `pieces` should receive elevated download priority, in the given order,
     * and all others neutral or ignored priority. `possible_footer` is a hint: pieces
     * in it that the sink is already downloading need not be demoted.
     *
     * If the command cannot be applied, `error` is set and the sink's previous
     * priorities should remain in effect. The scheduler does not retry.
     */
    virtual void download_only(const std::vector<piece_index_t>& pieces,
        const piece_range& possible_footer, error_code& error) = 0;
};

} // namespace sluice

#endif // SLUICE_PRIORITY_SINK_HEADER
