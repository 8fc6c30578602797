#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../../core/logger/logger.hpp"
#include "../../../core/types/constants.hpp"
#include "../../../utils/text/link_salvage.hpp"
#include "../../../utils/url/url.hpp"
#include "../crawler.hpp"

namespace Ferret {
namespace Engine {

using namespace Ferret::Core;
using namespace Ferret::Network::Http;
using Ferret::Utils::Url;

namespace net = boost::asio;

namespace {
constexpr int WORKER_POLL_INTERVAL_MS = 50;

// A reserved page slot; released unless a result was committed into it.
class PageSlot {
public:
    explicit PageSlot(CrawlContext& ctx) : ctx_(ctx) {
    }
    ~PageSlot() {
        if (held_)
            ctx_.release_page();
    }
    PageSlot(const PageSlot&)            = delete;
    PageSlot& operator=(const PageSlot&) = delete;

    void commit(CrawlResult result) {
        held_ = false;
        ctx_.commit(std::move(result));
    }

private:
    CrawlContext& ctx_;
    bool          held_ = true;
};

struct TaskGuard {
    Frontier& frontier;
    explicit TaskGuard(Frontier& f) : frontier(f) {
    }
    ~TaskGuard() {
        frontier.task_done();
    }
};

net::awaitable<void> pause(net::steady_timer& timer) {
    timer.expires_after(std::chrono::milliseconds(WORKER_POLL_INTERVAL_MS));
    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
}

CrawlResult failed_result(const CrawlTask& task, const std::string& error, const std::string& type) {
    CrawlResult result;
    result.url        = task.url;
    result.depth      = task.depth;
    result.status     = CrawlStatus::Error;
    result.error      = error;
    result.error_type = type;
    return result;
}

}  // namespace

net::awaitable<void> Crawler::worker_loop(CrawlContext& ctx, int worker_id) {
    auto              client = client_factory_();
    net::steady_timer idle(co_await net::this_coro::executor);

    while (!ctx.stop_requested()) {
        if (!ctx.try_reserve_page()) {
            if (ctx.budget_exhausted())
                break;
            // Other workers hold the remaining slots and may still give them back.
            co_await pause(idle);
            continue;
        }

        std::optional<CrawlTask> task;
        {
            PageSlot slot(ctx);
            task = ctx.frontier().pop();
            if (task) {
                TaskGuard done(ctx.frontier());
                try {
                    auto result = co_await process_task(ctx, *client, *task);
                    if (result)
                        slot.commit(std::move(*result));
                } catch (const std::exception& e) {
                    Logger::error("Worker " + std::to_string(worker_id) + " failed on " + task->url
                                  + ": " + e.what());
                    slot.commit(failed_result(*task, e.what(), "internal"));
                }
            }
        }

        if (!task) {
            if (ctx.frontier().drained())
                break;
            co_await pause(idle);
        }
    }
    Logger::debug("Worker " + std::to_string(worker_id) + " exiting");
}

net::awaitable<std::optional<CrawlResult>>
Crawler::process_task(CrawlContext& ctx, HttpClient& client, const CrawlTask& task) {
    if (config_.respect_robots) {
        if (!co_await robots_.is_allowed(task.url, client)) {
            ctx.record_robots_block();
            co_return std::nullopt;
        }
        apply_crawl_delay(task.url);
    }

    CrawlResult result;
    result.url   = task.url;
    result.depth = task.depth;

    std::string domain   = Url::domain(task.url);
    std::string base_url = task.url;
    std::string body;
    std::string content_type;

    if (auto cached = cache_.get(task.url)) {
        Logger::info("Cache hit: " + task.url);
        ctx.record_cache_hit();
        ctx.record_download(domain, 0);
        result.from_cache  = true;
        result.status_code = cached->status_code;
        content_type       = cached->content_type;
        body               = std::move(cached->body);
        if (!cached->url.empty())
            base_url = cached->url;
    }
    else {
        Response res       = co_await fetch_with_retry(ctx, client, task);
        result.status_code = res.status_code;
        if (res.error_type != ErrorType::None) {
            result.status     = CrawlStatus::Error;
            result.error      = res.error;
            result.error_type = to_string(res.error_type);
            co_return result;
        }

        ctx.record_download(domain, res.body.size());
        if (cache_.put(task.url, res))
            Logger::debug("Cached: " + task.url);
        content_type = res.content_type;
        body         = std::move(res.body);
        if (!res.effective_url.empty())
            base_url = res.effective_url;
    }

    if (!is_html_content_type(content_type)) {
        result.status     = CrawlStatus::Error;
        result.error      = "Not HTML content";
        result.error_type = "not_html";
        co_return result;
    }

    std::vector<std::string> links;
    try {
        Parser::PageData page = parser_->parse(body, base_url);
        result.fields         = std::move(page.fields);
        links                 = std::move(page.links);
    } catch (const std::exception& e) {
        Logger::warn("Parse failure on " + task.url + " (" + e.what() + "), salvaging links");
        result.error      = e.what();
        result.error_type = "parse";
        result.fields.clear();
        links = Utils::Text::salvage_links(body, base_url);
    }

    result.links = normalize_links(links, base_url);

    if (task.depth < config_.max_depth) {
        size_t admitted = 0;
        for (const auto& link : result.links) {
            if (ctx.stop_requested())
                break;
            if (co_await admit(ctx, client, link, task.depth + 1))
                ++admitted;
        }
        ctx.record_discovered(admitted);
        if (admitted > 0)
            Logger::debug("Queued " + std::to_string(admitted) + " links from " + task.url);
    }

    Logger::success("Crawled: " + task.url + " (Depth " + std::to_string(task.depth) + ", "
                    + std::to_string(result.links.size()) + " links)");
    co_return result;
}

net::awaitable<Response>
Crawler::fetch_with_retry(CrawlContext& ctx, HttpClient& client, const CrawlTask& task) {
    const std::string& url      = task.url;
    std::string        domain   = Url::domain(url);
    const int          attempts = 1 + config_.retry_count;

    Response          res;
    net::steady_timer backoff(co_await net::this_coro::executor);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            auto wait = get_backoff_time(config_.retry_delay, attempt - 1);
            Logger::debug("Backing off " + std::to_string(wait.count()) + "ms before retrying "
                          + url);
            backoff.expires_after(wait);
            co_await backoff.async_wait(net::use_awaitable);
        }

        co_await rate_limiter_.wait_for_slot(domain);

        std::optional<Proxy::Pool::ProxyRecord> proxy;
        if (proxies_.enabled())
            proxy = co_await proxies_.acquire();

        Request request = build_request(ctx, url, proxy ? proxy->address : "");

        std::string log_msg = "Fetching: " + url + " (Depth " + std::to_string(task.depth) + ")";
        if (attempt > 1)
            log_msg += " [Retry " + std::to_string(attempt - 1) + "]";
        if (proxy)
            log_msg += " [" + proxy->address + "]";
        Logger::info(log_msg);

        try {
            res = co_await client.get(request);
        } catch (const std::exception& e) {
            res            = Response{};
            res.error      = e.what();
            res.error_type = ErrorType::Connection;
        }
        if (res.error_type == ErrorType::None && res.status_code == 0) {
            res.error_type = ErrorType::Connection;
            if (res.error.empty())
                res.error = "No response";
        }

        if (res.error_type == ErrorType::None && res.status_code >= 200 && res.status_code < 400) {
            res.success = true;
            rate_limiter_.report_success(domain);
            if (proxy)
                proxies_.report_success(proxy->address);
            if (config_.preserve_cookies)
                ctx.cookies().store(domain, res.header_values("Set-Cookie"));
            co_return res;
        }

        res.success = false;
        if (res.error_type == ErrorType::InvalidUrl) {
            Logger::error("Failed: " + url + " (" + res.error + ")");
            co_return res;
        }

        if (res.error_type == ErrorType::None) {
            long code      = res.status_code;
            res.error_type = ErrorType::Http;
            if (res.error.empty())
                res.error = "HTTP " + std::to_string(code);

            if (code == static_cast<long>(HTTPCode::TooManyRequests)) {
                rate_limiter_.report_failure(domain, code);
                if (proxy)
                    proxies_.report_failure(proxy->address);
            }
            else if (code == static_cast<long>(HTTPCode::Forbidden) && proxy) {
                proxies_.report_failure(proxy->address);
            }
            else if (code >= 500) {
                rate_limiter_.report_failure(domain, code);
                if (proxy)
                    proxies_.report_success(proxy->address);
            }
            else {
                if (proxy)
                    proxies_.report_success(proxy->address);
                Logger::warn("HTTP " + std::to_string(code) + ": " + url);
                co_return res;
            }
        }
        else if (is_transport_error(res.error_type)) {
            rate_limiter_.report_failure(domain);
            if (proxy)
                proxies_.report_failure(proxy->address);
        }
        else {
            Logger::error("Failed: " + url + " (" + res.error + ")");
            co_return res;
        }

        if (attempt < attempts)
            Logger::warn("Attempt " + std::to_string(attempt) + "/" + std::to_string(attempts)
                         + " failed for " + url + ": " + res.error + " ["
                         + to_string(res.error_type) + "]");
    }

    Logger::error("Failed: " + url + " (" + res.error + ") - Max retries reached");
    co_return res;
}

Request Crawler::build_request(CrawlContext& ctx, const std::string& url, const std::string& proxy) {
    Request request;
    request.url              = url;
    request.proxy            = proxy;
    request.timeout          = config_.timeout;
    request.follow_redirects = config_.follow_redirects;
    request.verify_ssl       = config_.verify_ssl;

    std::map<std::string, std::string> headers = get_default_headers();
    for (const auto& [name, value] : config_.headers)
        headers[name] = value;
    headers["User-Agent"] = config_.user_agent;
    for (auto& [name, value] : headers)
        request.headers.emplace_back(name, value);

    request.cookies = config_.cookies;
    if (config_.preserve_cookies) {
        for (auto& [name, value] : ctx.cookies().cookies_for(Url::domain(url)))
            request.cookies[name] = value;
    }
    return request;
}

void Crawler::apply_crawl_delay(const std::string& url) {
    double delay = robots_.crawl_delay(url);
    if (delay <= 0.0)
        return;
    std::string domain = Url::domain(url);
    if (rate_limiter_.raise_domain_delay(domain, delay))
        Logger::info("Crawl-delay " + std::to_string(delay) + "s applied to " + domain);
}

}  // namespace Engine
}  // namespace Ferret
