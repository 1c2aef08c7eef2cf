#include "ediam/stack_trace.hpp"

namespace ediam {

std::string format_stack(const StackTrace& trace) {
  if (trace.empty()) {
    return "(no stack trace available)\n";
  }
  std::string out;
  for (std::size_t i = 0; i < trace.size(); ++i) {
    out += "  #";
    out += std::to_string(i);
    out += " ";
    out += boost::stacktrace::to_string(trace[i]);
    out += "\n";
  }
  return out;
}

std::string stack_trace(std::size_t skip_frames) {
  // +1 for this function
  return format_stack(StackTrace(skip_frames + 1, static_cast<std::size_t>(-1)));
}

}  // namespace ediam
