#include "priority_error.hpp"

namespace sluice {

std::string priority_error_category::message(int env) const
{
    switch(static_cast<priority_errc>(env))
    {
    case priority_errc::unknown: return "Unknown";
    case priority_errc::invalid_piece_index: return "Piece index not in priority table";
    case priority_errc::piece_count_mismatch:
        return "Command does not match the priority table's piece count";
    case priority_errc::empty_table: return "Priority table has no pieces";
    default: return "Unknown";
    }
}

std::error_condition
priority_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<priority_errc>(ev))
    {
    case priority_errc::invalid_piece_index:
        return std::errc::result_out_of_range;
    case priority_errc::piece_count_mismatch:
    case priority_errc::empty_table:
        return std::errc::invalid_argument;
    default:
        return std::error_condition(ev, *this);
    }
}

const priority_error_category& priority_category()
{
    static priority_error_category instance;
    return instance;
}

std::error_code make_error_code(priority_errc e)
{
    return std::error_code(static_cast<int>(e), priority_category());
}

std::error_condition make_error_condition(priority_errc e)
{
    return std::error_condition(static_cast<int>(e), priority_category());
}

} // namespace sluice
