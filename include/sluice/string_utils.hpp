#ifndef SLUICE_STRING_UTILS_HEADER
#define SLUICE_STRING_UTILS_HEADER

#include <cstdio> // std::snprintf
#include <iterator> // std::begin, std::end
#include <memory> // std::unique_ptr
#include <sstream>
#include <string>

namespace sluice {
namespace util {

template <typename... Args>
std::string format(const char* format_str, Args&&... args)
{
    const size_t length = std::snprintf(nullptr, 0, format_str, args...) + 1;
    std::unique_ptr<char[]> buffer(new char[length]);
    std::snprintf(buffer.get(), length, format_str, args...);
    // -1 to exclude the '\0' at the end
    return std::string(buffer.get(), buffer.get() + length - 1);
}

/**
 * Produces "[a, b, c]" from a container of streamable values. Used to print piece
 * index lists in logs and debug output.
 */
template <typename Iterable>
std::string join(const Iterable& values)
{
    std::ostringstream ss;
    ss << '[';
    bool first = true;
    for(const auto& v : values) {
        if(!first) {
            ss << ", ";
        }
        ss << v;
        first = false;
    }
    ss << ']';
    return ss.str();
}

} // namespace util
} // namespace sluice

#endif // SLUICE_STRING_UTILS_HEADER
