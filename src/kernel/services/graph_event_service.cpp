#include "kernel/services/graph_event_service.hpp"

namespace tg {

std::uint64_t GraphEventService::begin_batch() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++batch_;
}

void GraphEventService::push(NodeId id,
                             const std::string& name,
                             const std::string& source,
                             double ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(ComputeEvent{ batch_, id, name, source, ms, std::this_thread::get_id() });
}

std::vector<GraphEventService::ComputeEvent> GraphEventService::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ComputeEvent> out;
    out.swap(buffer_);
    return out;
}

size_t GraphEventService::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

std::map<std::string, GraphEventService::NodeTiming> GraphEventService::totals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, NodeTiming> out;
    for (const auto& ev : buffer_) {
        auto& t = out[ev.name];
        ++t.count;
        t.total_ms += ev.elapsed_ms;
    }
    return out;
}

} // namespace tg
