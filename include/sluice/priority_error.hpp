#ifndef SLUICE_PRIORITY_ERROR_HEADER
#define SLUICE_PRIORITY_ERROR_HEADER

#include "error_code.hpp"

#include <type_traits> // true_type
#include <string>

namespace sluice {

/**
 * These are the reasons a priority sink may refuse a `download_only` command. The
 * command is then not applied at all, i.e. the sink's previous priorities remain in
 * effect.
 */
enum class priority_errc
{
    unknown = 1,

    // A piece index in the command was outside the sink's piece table.
    invalid_piece_index,

    // The sink was set up for a different number of pieces than the catalog the
    // command was computed from.
    piece_count_mismatch,

    // The sink has no pieces, so no command can be meaningfully applied.
    empty_table
};

struct priority_error_category : public error_category
{
    const char* name() const noexcept override { return "priority"; }
    std::string message(int env) const override;
    error_condition default_error_condition(int ev) const noexcept override;
};

const priority_error_category& priority_category();
error_code make_error_code(priority_errc e);
error_condition make_error_condition(priority_errc e);

} // namespace sluice

namespace SLUICE_ERROR_CODE_NS {
    template<>
    struct is_error_code_enum<sluice::priority_errc> : public std::true_type {};
}

#endif // SLUICE_PRIORITY_ERROR_HEADER
