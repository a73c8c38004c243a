#ifndef SLUICE_SETTINGS_HEADER
#define SLUICE_SETTINGS_HEADER

#include <cstdint>

namespace sluice {
namespace values {

constexpr int none = -2;

} // values

/** Settings of a single `window_scheduler`. */
struct scheduler_settings
{
    // The number of pieces in the sequential window, i.e. the largest difference
    // between the last and first requested piece index plus one. A small window
    // keeps the transfer engine focused on the pieces the player needs next rather
    // than on overall throughput. Must be at least 1.
    int window_size = 8;

    // The number of bytes at the start of the file that are considered container
    // metadata. The scheduler does not request these itself, but exposes the
    // corresponding pieces so that whoever handles the metadata phase can pin them.
    int64_t header_size = 128 * 1024;

    // The number of bytes at the end of the file that are considered container
    // metadata. Unfinished footer pieces are added to every rebuilt window.
    // `values::none` means the same as `header_size`.
    int64_t footer_size = values::none;

    // Seeking into this many trailing bytes is considered a footer access, which
    // adds the target piece to the active set without discarding the current
    // window. Should be at least `footer_size`. `values::none` means the same as
    // `header_size`.
    int64_t possible_footer_size = values::none;

    /**
     * Returns a copy in which every `values::none` field is replaced by its
     * effective value.
     */
    scheduler_settings resolved() const
    {
        scheduler_settings s = *this;
        if(s.footer_size == values::none) {
            s.footer_size = s.header_size;
        }
        if(s.possible_footer_size == values::none) {
            s.possible_footer_size = s.header_size;
        }
        return s;
    }
};

} // namespace sluice

#endif // SLUICE_SETTINGS_HEADER
