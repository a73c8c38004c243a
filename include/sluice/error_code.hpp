#ifndef SLUICE_ERROR_CODE_HEADER
#define SLUICE_ERROR_CODE_HEADER

#include <system_error>

namespace sluice {

// priority_sink reports rejected commands through an error_code out-parameter. The
// sinks and priority_errc only ever name these aliases and SLUICE_ERROR_CODE_NS (for
// the is_error_code_enum specialization), so that a sink backed by an engine that
// speaks Boost.System only needs this header changed.
using std::errc;
using std::error_category;
using std::error_code;
using std::error_condition;
using std::generic_category;
using std::is_error_code_enum;
using std::is_error_condition_enum;
using std::make_error_code;
using std::make_error_condition;
using std::system_error;

#define SLUICE_ERROR_CODE_NS std

} // sluice

#endif // SLUICE_ERROR_CODE_HEADER
