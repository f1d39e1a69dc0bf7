#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "tg_types.hpp"

namespace tg {

/**
 * @brief Thread-safe log of node evaluations.
 *
 * Processors open one batch per execute() call and push one event per
 * successful evaluation. A failing node records nothing; when a parallel
 * level fails, its siblings that completed keep their events.
 */
class GraphEventService {
 public:
  struct ComputeEvent {
    std::uint64_t batch;
    NodeId id;
    std::string name;
    std::string source;
    double elapsed_ms;
    std::thread::id thread;
  };

  struct NodeTiming {
    size_t count = 0;
    double total_ms = 0.0;
  };

  // Returns the number of the batch that later pushes are filed under.
  std::uint64_t begin_batch();

  void push(NodeId id, const std::string& name, const std::string& source,
            double ms);
  std::vector<ComputeEvent> drain();
  size_t size() const;

  // Evaluations and time per node name, over the events not yet drained.
  std::map<std::string, NodeTiming> totals() const;

 private:
  mutable std::mutex mutex_;
  std::uint64_t batch_ = 0;
  std::vector<ComputeEvent> buffer_;
};

}  // namespace tg
