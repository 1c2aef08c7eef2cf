#ifndef EDIAM_STATS_HPP_
#define EDIAM_STATS_HPP_

#include "ring_buffer.hpp"

#include <cstdint>

#include <atomic>

namespace ediam {

// ============================================================================
// ServerStats - Atomic performance counters
// ============================================================================

struct alignas(kCacheLine) ServerStats {
  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_connections{0};

  // Error counters
  std::atomic<uint64_t> accept_errors{0};
  std::atomic<uint64_t> handshake_errors{0};
  std::atomic<uint64_t> read_errors{0};
  std::atomic<uint64_t> handler_faults{0};

  // Throughput counters
  std::atomic<uint64_t> messages_in{0};
  std::atomic<uint64_t> bytes_out{0};

  void reset() {
    total_connections = 0;
    active_connections = 0;
    rejected_connections = 0;
    accept_errors = 0;
    handshake_errors = 0;
    read_errors = 0;
    handler_faults = 0;
    messages_in = 0;
    bytes_out = 0;
  }
};

}  // namespace ediam

#endif  // EDIAM_STATS_HPP_
