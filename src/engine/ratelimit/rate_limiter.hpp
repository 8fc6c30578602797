#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "../../core/types/constants.hpp"

class RateLimiterTest_CurrentDelayDoesNotTrackDomain_Test;

namespace Ferret {
namespace Engine {

// All durations in seconds.
struct RateLimiterConfig {
    double                        base_delay         = Core::Constants::DEFAULT_BASE_DELAY;
    double                        min_delay          = Core::Constants::DEFAULT_MIN_DELAY;
    double                        max_delay          = Core::Constants::DEFAULT_MAX_DELAY;
    double                        random_range       = Core::Constants::DEFAULT_RANDOM_RANGE;
    double                        retry_factor       = Core::Constants::DEFAULT_RETRY_FACTOR;
    double                        temporary_duration = Core::Constants::DEFAULT_TEMPORARY_DELAY;
    std::map<std::string, double> domain_delays;
};

/**
 * Per-domain request pacing.
 *
 * reserve() computes the wait for the next request to a domain and books that
 * slot before returning, so concurrent callers queue up behind each other's
 * reservations instead of all waking at once. Reserved slots for a domain are
 * monotonically increasing. Failures scale the delay by
 * retry_factor^min(failures, 4); a 429 installs a temporary floor that expires
 * after temporary_duration.
 */
class RateLimiter {
#ifndef CPPCHECK
    friend class ::RateLimiterTest_CurrentDelayDoesNotTrackDomain_Test;
#endif

public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(RateLimiterConfig config = {});

    boost::asio::awaitable<void> wait_for_slot(const std::string& domain);
    std::chrono::milliseconds    reserve(const std::string& domain);

    void report_success(const std::string& domain);
    void report_failure(const std::string& domain, long status_code = 0);

    void set_domain_delay(const std::string& domain, double seconds);
    // Sets the override only when it exceeds the delay already configured. True if it did.
    bool raise_domain_delay(const std::string& domain, double seconds);
    void set_temporary_delay(const std::string& domain,
                             double             seconds,
                             std::optional<double> duration = std::nullopt);
    void reset(const std::string& domain);
    void reset_all();

    // Effective delay before jitter.
    double current_delay(const std::string& domain);
    int    failures(const std::string& domain) const;

    const RateLimiterConfig& config() const {
        return config_;
    }

private:
    struct DomainState {
        Clock::time_point last_request;
        bool              has_requested        = false;
        int               consecutive_failures = 0;
        double            temporary_delay      = 0.0;
        Clock::time_point temporary_until;
    };

    // Callers hold mutex_.
    double compute_delay(const std::string& domain, DomainState& state, Clock::time_point now);
    double uniform(double lo, double hi);
    double clamp_delay(double seconds) const;

    RateLimiterConfig                            config_;
    mutable std::mutex                           mutex_;
    std::unordered_map<std::string, DomainState> domains_;
    std::mt19937                                 rng_;
};

}  // namespace Engine
}  // namespace Ferret
