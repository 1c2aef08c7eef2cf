#ifndef EDIAM_STACK_TRACE_HPP_
#define EDIAM_STACK_TRACE_HPP_

// Stack traces for handler faults (Boost.Stacktrace).
//
// A handler that wants its fault located where it happened throws through
// throw_with_trace(); the connection's fault barrier then logs the stack of
// the throwing frame instead of the already unwound catch site:
//
//   if (!valid) ediam::throw_with_trace(std::invalid_argument("bad AVP"));

#include <boost/exception/enable_error_info.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/exception/get_error_info.hpp>
#include <boost/exception/info.hpp>
#include <boost/stacktrace.hpp>

#include <cstddef>
#include <exception>
#include <string>

namespace ediam {

using StackTrace = boost::stacktrace::stacktrace;

using ThrownAt = boost::error_info<struct tag_thrown_at, StackTrace>;

template <class E>
[[noreturn]] void throw_with_trace(const E& e) {
  throw boost::enable_error_info(e) << ThrownAt(StackTrace());
}

// Stack recorded by throw_with_trace(), or nullptr.
inline const StackTrace* thrown_at(const std::exception& e) {
  return boost::get_error_info<ThrownAt>(e);
}

// One frame per line.
std::string format_stack(const StackTrace& trace);

// Stack of the calling thread without its innermost skip_frames frames.
std::string stack_trace(std::size_t skip_frames = 1);

}  // namespace ediam

#endif  // EDIAM_STACK_TRACE_HPP_
