#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"

using namespace Ferret::Core;

TEST(ConfigTest, Defaults) {
    char* argv[] = {(char*)"ferret", (char*)"https://test.com"};
    auto  config = Config::parse(2, argv);

    ASSERT_EQ(config.urls.size(), 1u);
    EXPECT_EQ(config.urls[0], "https://test.com");
    EXPECT_EQ(config.depth, Constants::DEFAULT_DEPTH);
    EXPECT_EQ(config.max_pages, Constants::DEFAULT_MAX_PAGES);
    EXPECT_EQ(config.workers, Constants::DEFAULT_WORKERS);
    EXPECT_DOUBLE_EQ(config.delay, Constants::DEFAULT_BASE_DELAY);
    EXPECT_TRUE(config.cache_enabled);
    EXPECT_TRUE(config.respect_robots);
    EXPECT_TRUE(config.preserve_cookies);
    EXPECT_TRUE(config.verify_ssl);
    EXPECT_EQ(config.user_agent, Constants::USER_AGENT);
}

TEST(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"ferret",
                    (char*)"https://test.com",
                    (char*)"https://other.com",
                    (char*)"--depth",
                    (char*)"10",
                    (char*)"--max-pages",
                    (char*)"500",
                    (char*)"-w",
                    (char*)"12",
                    (char*)"--threads",
                    (char*)"4",
                    (char*)"--delay",
                    (char*)"0.25",
                    (char*)"--proxy",
                    (char*)"http://p1.com:8080",
                    (char*)"-p",
                    (char*)"http://p2.com:8080",
                    (char*)"--proxy-strategy",
                    (char*)"fastest",
                    (char*)"--proxy-max-failures",
                    (char*)"5",
                    (char*)"--no-cache",
                    (char*)"--no-robots",
                    (char*)"--insecure"};
    auto  config = Config::parse(24, argv);

    EXPECT_EQ(config.urls.size(), 2u);
    EXPECT_EQ(config.depth, 10);
    EXPECT_EQ(config.max_pages, 500);
    EXPECT_EQ(config.workers, 12);
    EXPECT_EQ(config.threads, 4);
    EXPECT_DOUBLE_EQ(config.delay, 0.25);
    EXPECT_EQ(config.proxies.size(), 2u);
    EXPECT_EQ(config.proxy_strategy, "fastest");
    EXPECT_EQ(config.proxy_max_failures, 5);
    EXPECT_FALSE(config.cache_enabled);
    EXPECT_FALSE(config.respect_robots);
    EXPECT_FALSE(config.verify_ssl);
    EXPECT_TRUE(config.follow_redirects);
}

TEST(ConfigTest, FiltersHeadersAndCookies) {
    char* argv[] = {(char*)"ferret",
                    (char*)"https://a.test",
                    (char*)"--allowed-domain",
                    (char*)"a.test",
                    (char*)"--include",
                    (char*)"/docs/",
                    (char*)"--exclude",
                    (char*)"\\.pdf$",
                    (char*)"--header",
                    (char*)"X-Trace: abc:123",
                    (char*)"--cookie",
                    (char*)"session=xyz=1",
                    (char*)"--no-preserve-cookies"};
    auto  config = Config::parse(13, argv);

    EXPECT_EQ(config.allowed_domains, std::vector<std::string>{"a.test"});
    EXPECT_EQ(config.include_patterns, std::vector<std::string>{"/docs/"});
    EXPECT_EQ(config.exclude_patterns, std::vector<std::string>{"\\.pdf$"});
    EXPECT_EQ(config.headers["X-Trace"], "abc:123");
    EXPECT_EQ(config.cookies["session"], "xyz=1");
    EXPECT_FALSE(config.preserve_cookies);
}

TEST(ConfigTest, MalformedHeaderRejected) {
    char* argv[] = {(char*)"ferret", (char*)"https://a.test", (char*)"--header", (char*)"novalue"};
    EXPECT_THROW(Config::parse(4, argv), std::invalid_argument);

    char* argv2[] = {(char*)"ferret", (char*)"https://a.test", (char*)"--cookie", (char*)"=x"};
    EXPECT_THROW(Config::parse(4, argv2), std::invalid_argument);
}

TEST(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        seeds:
          - "https://yaml.test/"
        max_depth: 4
        max_pages: 50
        workers: 8
        base_delay: 0.5
        min_delay: 0.1
        max_delay: 30
        domain_delays:
          slow.test: 5
        proxies:
          - "http://yaml_p1"
          - "http://yaml_p2"
        proxy_check_interval: 120
        cache_enabled: false
        cache_expiry: 60
        cache_max_size: 10
        allowed_domains: yaml.test
        exclude:
          - "\\?print="
        timeout: 12.5
        retry_count: 1
        retry_delay: 500
        headers:
          Accept-Language: de
        respect_robots: false
    )";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"ferret", (char*)"--config", (char*)"test_config.yaml"};
    auto  config = Config::parse(3, argv);

    ASSERT_EQ(config.urls.size(), 1u);
    EXPECT_EQ(config.urls[0], "https://yaml.test/");
    EXPECT_EQ(config.depth, 4);
    EXPECT_EQ(config.max_pages, 50);
    EXPECT_EQ(config.workers, 8);
    EXPECT_DOUBLE_EQ(config.delay, 0.5);
    EXPECT_DOUBLE_EQ(config.min_delay, 0.1);
    EXPECT_DOUBLE_EQ(config.max_delay, 30.0);
    EXPECT_DOUBLE_EQ(config.domain_delays["slow.test"], 5.0);
    EXPECT_EQ(config.proxies.size(), 2u);
    EXPECT_EQ(config.proxy_check_interval, 120);
    EXPECT_FALSE(config.cache_enabled);
    EXPECT_EQ(config.cache_expiry, 60);
    EXPECT_EQ(config.cache_max_size, 10u);
    EXPECT_EQ(config.allowed_domains, std::vector<std::string>{"yaml.test"});
    EXPECT_EQ(config.exclude_patterns.size(), 1u);
    EXPECT_DOUBLE_EQ(config.timeout, 12.5);
    EXPECT_EQ(config.retries, 1);
    EXPECT_EQ(config.retry_delay_ms, 500);
    EXPECT_EQ(config.headers["Accept-Language"], "de");
    EXPECT_FALSE(config.respect_robots);

    std::remove("test_config.yaml");
}

TEST(ConfigTest, CliOverridesYaml) {
    std::string   yaml_content = "depth: 20\nthreads: 100\nmax_pages: 7";
    std::ofstream ofs("test_ovr.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {
        (char*)"ferret", (char*)"--config", (char*)"test_ovr.yaml", (char*)"--depth", (char*)"30"};
    auto config = Config::parse(5, argv);

    EXPECT_EQ(config.depth, 30);
    EXPECT_EQ(config.threads, 100);
    EXPECT_EQ(config.max_pages, 7);

    std::remove("test_ovr.yaml");
}

TEST(ConfigTest, ProxyListFile) {
    std::ofstream pfile("proxies.txt");
    pfile << "http://p1\nhttp://p2\n\nhttp://p3";
    pfile.close();

    char* argv[] = {(char*)"ferret", (char*)"--proxy-list", (char*)"proxies.txt"};
    auto  config = Config::parse(3, argv);

    EXPECT_EQ(config.proxies.size(), 3u);
    EXPECT_EQ(config.proxies[0], "http://p1");

    std::remove("proxies.txt");
}

TEST(ConfigTest, InvalidYaml) {
    std::ofstream ofs("invalid.yaml");
    ofs << "depth: [not an integer]";
    ofs.close();

    const char* argv[] = {"ferret", "--config", "invalid.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
    std::remove("invalid.yaml");
}

TEST(ConfigTest, NonExistentFile) {
    const char* argv[] = {"ferret", "--config", "does_not_exist.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
}

TEST(ConfigTest, MissingProxyListThrows) {
    EXPECT_THROW(Config::read_proxy_list("no_such_proxies.txt"), std::runtime_error);
}

TEST(ConfigTest, ProxyListRobustness) {
    std::ofstream ofs("dirty_proxies.txt");
    ofs << "http://p1:8080\n";
    ofs << "  # a comment line  \n";
    ofs << "\n";
    ofs << "  http://p2:9090   # trailing comment\n";
    ofs.close();

    const char* argv[] = {"ferret", "--proxy-list", "dirty_proxies.txt"};
    auto        config = Config::parse(3, (char**)argv);
    ASSERT_EQ(config.proxies.size(), 2u);
    EXPECT_EQ(config.proxies[1], "http://p2:9090");
    std::remove("dirty_proxies.txt");
}

TEST(ConfigTest, ExtremeValues) {
    char* argv[] = {(char*)"ferret", (char*)"--threads", (char*)"999999"};
    auto  config = Config::parse(3, argv);
    EXPECT_GT(config.threads, 0);
}

TEST(ConfigTest, EmptyConfig) {
    std::ofstream ofs("empty.yaml");
    ofs << "";
    ofs.close();

    char* argv[] = {(char*)"ferret", (char*)"--config", (char*)"empty.yaml"};
    auto  config = Config::parse(3, argv);
    EXPECT_EQ(config.depth, 3);

    std::remove("empty.yaml");
}
