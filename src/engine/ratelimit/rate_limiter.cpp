#include "rate_limiter.hpp"
#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cmath>
#include "../../core/logger/logger.hpp"

namespace Ferret {
namespace Engine {

using Ferret::Core::Constants;
using Ferret::Core::Logger;

namespace {
std::chrono::milliseconds to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}
}  // namespace

RateLimiter::RateLimiter(RateLimiterConfig config)
    : config_(std::move(config)), rng_(std::random_device{}()) {
    if (config_.min_delay < 0.0)
        config_.min_delay = 0.0;
    if (config_.max_delay < config_.min_delay)
        config_.max_delay = config_.min_delay;
    config_.base_delay = std::max(config_.base_delay, config_.min_delay);
    for (auto& [domain, delay] : config_.domain_delays)
        delay = clamp_delay(delay);
}

double RateLimiter::clamp_delay(double seconds) const {
    return std::clamp(seconds, config_.min_delay, config_.max_delay);
}

double RateLimiter::uniform(double lo, double hi) {
    if (hi <= lo)
        return lo;
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

double RateLimiter::compute_delay(const std::string& domain,
                                  DomainState&       state,
                                  Clock::time_point  now) {
    auto   it    = config_.domain_delays.find(domain);
    double delay = (it != config_.domain_delays.end()) ? it->second : config_.base_delay;

    if (state.temporary_delay > 0.0) {
        if (now < state.temporary_until) {
            delay = std::max(delay, state.temporary_delay);
        }
        else {
            state.temporary_delay = 0.0;
            Logger::debug("Temporary delay expired for " + domain);
        }
    }

    if (state.consecutive_failures > 0) {
        int exponent = std::min(state.consecutive_failures, Constants::MAX_BACKOFF_EXPONENT);
        delay *= std::pow(config_.retry_factor, exponent);
    }

    return clamp_delay(std::min(delay, config_.max_delay));
}

std::chrono::milliseconds RateLimiter::reserve(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        now   = Clock::now();
    DomainState&                state = domains_[domain];

    double delay    = compute_delay(domain, state, now);
    double jittered = delay * (1.0 + uniform(0.0, config_.random_range));

    std::chrono::milliseconds wait(0);
    if (!state.has_requested) {
        wait                = to_ms(jittered * uniform(0.2, 0.5));
        state.has_requested = true;
    }
    else {
        auto slot = state.last_request + to_ms(jittered);
        if (slot > now)
            wait = std::chrono::duration_cast<std::chrono::milliseconds>(slot - now);
    }

    state.last_request = now + wait;
    return wait;
}

boost::asio::awaitable<void> RateLimiter::wait_for_slot(const std::string& domain) {
    auto wait = reserve(domain);
    if (wait.count() <= 0)
        co_return;

    Logger::debug("Politeness: waiting " + std::to_string(wait.count()) + "ms for " + domain);
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(wait);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

void RateLimiter::report_success(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = domains_.find(domain);
    if (it == domains_.end())
        return;
    it->second.consecutive_failures = 0;
    it->second.temporary_delay      = 0.0;
}

void RateLimiter::report_failure(const std::string& domain, long status_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    DomainState&                state = domains_[domain];
    state.consecutive_failures++;

    if (status_code == 429) {
        auto   now       = Clock::now();
        double current   = compute_delay(domain, state, now);
        double temporary = std::min(current * config_.retry_factor * 2.0, config_.max_delay);

        state.temporary_delay = temporary;
        state.temporary_until = now + to_ms(config_.temporary_duration);
        Logger::warn("Rate limited by " + domain + ", backing off to "
                     + std::to_string(temporary) + "s");
    }
}

void RateLimiter::set_domain_delay(const std::string& domain, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.domain_delays[domain] = clamp_delay(seconds);
}

bool RateLimiter::raise_domain_delay(const std::string& domain, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it      = config_.domain_delays.find(domain);
    double                      current = (it != config_.domain_delays.end()) ? it->second
                                                                              : config_.base_delay;
    double                      wanted  = clamp_delay(seconds);
    if (wanted <= current)
        return false;
    config_.domain_delays[domain] = wanted;
    return true;
}

void RateLimiter::set_temporary_delay(const std::string&    domain,
                                      double                seconds,
                                      std::optional<double> duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    DomainState&                state = domains_[domain];
    state.temporary_delay             = std::min(seconds, config_.max_delay);
    state.temporary_until = Clock::now() + to_ms(duration.value_or(config_.temporary_duration));
}

void RateLimiter::reset(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    domains_.erase(domain);
}

void RateLimiter::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    domains_.clear();
}

double RateLimiter::current_delay(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = domains_.find(domain);
    if (it == domains_.end()) {
        DomainState fresh;
        return compute_delay(domain, fresh, Clock::now());
    }
    return compute_delay(domain, it->second, Clock::now());
}

int RateLimiter::failures(const std::string& domain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = domains_.find(domain);
    return it == domains_.end() ? 0 : it->second.consecutive_failures;
}

}  // namespace Engine
}  // namespace Ferret
