#include "frontier.hpp"

namespace Ferret {
namespace Engine {

bool Frontier::claim(const std::string& url, int depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!visited_.insert(url).second)
        return false;
    queue_.push({url, depth});
    return true;
}

bool Frontier::seen(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.count(url) > 0;
}

std::optional<CrawlTask> Frontier::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
        return std::nullopt;

    auto task = std::move(queue_.front());
    queue_.pop();
    in_flight_++;
    return task;
}

void Frontier::task_done() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ > 0)
        in_flight_--;
}

bool Frontier::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty() && in_flight_ == 0;
}

size_t Frontier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t Frontier::visited_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.size();
}

int Frontier::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

}  // namespace Engine
}  // namespace Ferret
