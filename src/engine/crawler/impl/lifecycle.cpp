#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <csignal>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Ferret {
namespace Engine {

using namespace Ferret::Core;

void Crawler::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < config_.threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::debug("Started " + std::to_string(config_.threads) + " IO threads.");
}

void Crawler::init_signals(CrawlContext& ctx) {
    signals_ = std::make_unique<boost::asio::signal_set>(ioc_, SIGINT, SIGTERM);
    signals_->async_wait([&ctx](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::warn("Signal " + std::to_string(signal_number)
                         + " received. Finishing in-flight pages...");
            ctx.request_stop();
        }
    });
}

void Crawler::spawn_workers(CrawlContext& ctx) {
    for (int i = 0; i < config_.workers; ++i) {
        ctx.worker_started();
        boost::asio::co_spawn(ioc_, worker_loop(ctx, i), [this, &ctx, i](std::exception_ptr e) {
            if (e) {
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    Logger::error("Worker " + std::to_string(i) + " died: " + ex.what());
                } catch (...) {
                    Logger::error("Worker " + std::to_string(i) + " died: unknown exception");
                }
            }
            {
                std::lock_guard<std::mutex> lock(done_mutex_);
                ctx.worker_finished();
            }
            done_cv_.notify_all();
        });
    }
}

void Crawler::await_completion(CrawlContext& ctx) {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [&ctx] { return ctx.live_workers() == 0; });
}

void Crawler::shutdown() {
    if (io_threads_.empty())
        return;

    Logger::debug("Shutting down resources...");
    proxies_.stop();
    if (signals_) {
        boost::asio::post(ioc_, [this]() {
            boost::system::error_code ec;
            signals_->cancel(ec);
        });
    }

    // Outstanding work (the cancelled health loop and signal wait) drains, then run() returns.
    work_guard_.reset();
    for (auto& t : io_threads_) {
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();
    signals_.reset();
    Logger::debug("Shutdown complete.");
}

}  // namespace Engine
}  // namespace Ferret
