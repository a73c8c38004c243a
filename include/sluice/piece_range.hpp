#ifndef SLUICE_PIECE_RANGE_HEADER
#define SLUICE_PIECE_RANGE_HEADER

#include "types.hpp"

namespace sluice {

/**
 * An inclusive range of piece indices, [first, last]. The default constructed range
 * is empty (first > last) and contains no index.
 */
struct piece_range
{
    piece_index_t first = 0;
    piece_index_t last = -1;

    piece_range() = default;
    piece_range(piece_index_t first_, piece_index_t last_) : first(first_), last(last_) {}

    bool empty() const noexcept { return last < first; }

    int length() const noexcept { return empty() ? 0 : last - first + 1; }

    bool contains(const piece_index_t index) const noexcept
    {
        return (index >= first) && (index <= last);
    }

    bool contains(const piece_range& other) const noexcept
    {
        return other.empty() || ((other.first >= first) && (other.last <= last));
    }
};

inline bool operator==(const piece_range& a, const piece_range& b) noexcept
{
    // all empty ranges are equal
    if(a.empty() || b.empty()) {
        return a.empty() && b.empty();
    }
    return (a.first == b.first) && (a.last == b.last);
}

inline bool operator!=(const piece_range& a, const piece_range& b) noexcept
{
    return !(a == b);
}

inline bool operator<(const piece_range& a, const piece_range& b) noexcept
{
    return a.first == b.first ? a.last < b.last : a.first < b.first;
}

} // namespace sluice

#include <functional>

namespace std {

template <>
struct hash<sluice::piece_range>
{
    size_t operator()(const sluice::piece_range& r) const noexcept
    {
        if(r.empty()) {
            return 51;
        }
        return std::hash<int>()(r.first) * (101 ^ std::hash<int>()(r.last)) * 31 + 51;
    }
};

} // namespace std

#endif // SLUICE_PIECE_RANGE_HEADER
