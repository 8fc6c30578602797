#include "crawler.hpp"
#include <algorithm>
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../network/http/beast_client.hpp"
#include "../../parser/html_parser.hpp"
#include "../../proxy/pool/prober.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Ferret {
namespace Engine {

using namespace Ferret::Core;
using Ferret::Network::Http::BeastClient;
using Ferret::Network::Http::HttpClient;
using Ferret::Utils::InvalidUrl;
using Ferret::Utils::Url;

namespace {

ClientFactory make_beast_factory(const CrawlerConfig& config) {
    auto connect_timeout = std::min(config.timeout,
                                    std::chrono::milliseconds(std::chrono::seconds(
                                        Constants::CONNECT_TIMEOUT_SECONDS)));
    std::string user_agent = config.user_agent;
    return [connect_timeout, user_agent]() -> std::unique_ptr<HttpClient> {
        auto client = std::make_unique<BeastClient>();
        client->set_connect_timeout(connect_timeout);
        client->set_user_agent(user_agent);
        return client;
    };
}

std::shared_ptr<Proxy::Pool::ProxyProber> make_prober(const CrawlerConfig& config) {
    if (config.proxy.proxies.empty())
        return nullptr;
    return std::make_shared<Proxy::Pool::HttpProber>(
        config.proxy.test_url, config.proxy.probe_timeout, config.verify_ssl);
}

}  // namespace

Crawler::Crawler(CrawlerConfig config)
    : Crawler(config,
              make_beast_factory(config),
              std::make_shared<Parser::HtmlParser>(),
              make_prober(config)) {
}

Crawler::Crawler(CrawlerConfig                             config,
                 ClientFactory                             client_factory,
                 std::shared_ptr<const Parser::PageParser> parser,
                 std::shared_ptr<Proxy::Pool::ProxyProber> prober)
    : config_(std::move(config)),
      client_factory_(std::move(client_factory)),
      parser_(std::move(parser)),
      rate_limiter_(config_.rate_limit),
      robots_(config_.user_agent, config_.timeout, config_.verify_ssl),
      cache_(config_.cache),
      proxies_(config_.proxy, std::move(prober)) {
    validate_config();
    compile_filters();
    for (const auto& domain : config_.allowed_domains)
        allowed_domains_.insert(Utils::Text::to_lower(domain));
}

Crawler::~Crawler() {
    stop();
    shutdown();
}

void Crawler::validate_config() const {
    if (config_.max_pages < 1)
        throw std::invalid_argument("max_pages must be at least 1");
    if (config_.workers < 1)
        throw std::invalid_argument("workers must be at least 1");
    if (config_.threads < 1)
        throw std::invalid_argument("threads must be at least 1");
    if (config_.max_depth < 0)
        throw std::invalid_argument("max_depth must not be negative");
    if (config_.retry_count < 0)
        throw std::invalid_argument("retry_count must not be negative");
    if (!client_factory_)
        throw std::invalid_argument("A client factory is required");
    if (!parser_)
        throw std::invalid_argument("A page parser is required");
}

void Crawler::compile_filters() {
    auto compile = [](const std::vector<std::string>& patterns, std::vector<std::regex>& out) {
        for (const auto& pattern : patterns) {
            try {
                out.emplace_back(pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                throw std::invalid_argument("Invalid URL pattern '" + pattern + "': " + e.what());
            }
        }
    };
    compile(config_.include_patterns, include_res_);
    compile(config_.exclude_patterns, exclude_res_);
}

void Crawler::seed_frontier(CrawlContext& ctx) {
    if (config_.seeds.empty())
        throw std::invalid_argument("No seed URLs given");

    size_t seeded = 0;
    for (const auto& seed : config_.seeds) {
        try {
            if (ctx.frontier().claim(Url::normalize(seed), 0))
                ++seeded;
        } catch (const InvalidUrl& e) {
            Logger::error("Skipping seed: " + std::string(e.what()));
        }
    }
    if (seeded == 0)
        throw std::invalid_argument("No valid seed URLs");
    Logger::info("Seeded frontier with " + std::to_string(seeded) + " URL(s)");
}

std::vector<CrawlResult> Crawler::crawl() {
    CrawlContext ctx(static_cast<size_t>(config_.max_pages));
    seed_frontier(ctx);

    if (cache_.enabled()) {
        if (config_.clear_cache) {
            cache_.clear();
            Logger::info("Cache cleared");
        }
        else {
            cache_.clear_expired();
        }
    }

    auto started = std::chrono::steady_clock::now();
    active_ctx_  = &ctx;

    init_io_services();
    if (config_.handle_signals)
        init_signals(ctx);
    proxies_.start(ioc_.get_executor());
    spawn_workers(ctx);
    Logger::info("Crawler: " + std::to_string(config_.workers) + " workers running");

    await_completion(ctx);
    active_ctx_ = nullptr;
    shutdown();

    CrawlStats stats = ctx.stats();
    stats.elapsed    = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        last_stats_ = stats;
    }

    Logger::success("Crawl finished: " + std::to_string(stats.pages_crawled) + " pages ("
                    + std::to_string(stats.successes) + " ok, " + std::to_string(stats.errors)
                    + " failed) in " + std::to_string(stats.elapsed.count()) + "ms");
    return ctx.take_results();
}

void Crawler::stop() {
    if (CrawlContext* ctx = active_ctx_.load())
        ctx->request_stop();
}

CrawlStats Crawler::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_stats_;
}

bool Crawler::passes_filters(const std::string& url) const {
    if (!include_res_.empty()) {
        bool included = false;
        for (const auto& re : include_res_) {
            if (std::regex_search(url, re)) {
                included = true;
                break;
            }
        }
        if (!included)
            return false;
    }

    for (const auto& re : exclude_res_) {
        if (std::regex_search(url, re))
            return false;
    }

    if (!allowed_domains_.empty() && allowed_domains_.count(Url::domain(url)) == 0)
        return false;
    return true;
}

std::vector<std::string> Crawler::normalize_links(const std::vector<std::string>& links,
                                                  const std::string&              base_url) const {
    std::vector<std::string>        out;
    std::unordered_set<std::string> seen;
    for (const auto& link : links) {
        std::string absolute = Url::resolve(base_url, link);
        if (absolute.empty())
            continue;
        try {
            std::string normalized = Url::normalize(absolute);
            if (seen.insert(normalized).second)
                out.push_back(std::move(normalized));
        } catch (const InvalidUrl& e) {
            Logger::debug("Dropping link: " + std::string(e.what()));
        }
    }
    return out;
}

boost::asio::awaitable<bool>
Crawler::admit(CrawlContext& ctx, HttpClient& client, const std::string& url, int depth) {
    if (!passes_filters(url))
        co_return false;
    if (ctx.frontier().seen(url))
        co_return false;
    if (config_.respect_robots && !co_await robots_.is_allowed(url, client)) {
        ctx.record_robots_block();
        co_return false;
    }
    co_return ctx.frontier().claim(url, depth);
}

}  // namespace Engine
}  // namespace Ferret
