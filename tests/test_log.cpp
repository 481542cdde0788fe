#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

TEST_CASE("test log") {
  const char *path = "prmerge_test.log";
  std::remove(path);
  auto early = prmerge::category_logger("early");
  prmerge::init_logger(spdlog::level::info, "", path, 0);
  auto config = prmerge::category_logger("config");
  prmerge::configure_log_categories({{"config", spdlog::level::debug}});

  spdlog::debug("root debug message");
  spdlog::info("info message");
  early->info("early category message");
  config->debug("config debug message");
  config->trace("config trace message");
  spdlog::shutdown();

  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("root debug message") == std::string::npos);
  REQUIRE(content.find("early category message") != std::string::npos);
  REQUIRE(content.find("config debug message") != std::string::npos);
  REQUIRE(content.find("config trace message") == std::string::npos);
  f.close();
  std::remove(path);
}

TEST_CASE("log file attached after category logging") {
  const char *first = "prmerge_test_first.log";
  const char *second = "prmerge_test_second.log";
  std::remove(first);
  std::remove(second);
  auto cli = prmerge::category_logger("cli");
  for (int i = 0; i < 2000; ++i) {
    cli->warn("queued before file {}", i);
  }
  prmerge::init_logger(spdlog::level::info, "", first, 0);
  auto read = [](const char *path) {
    std::ifstream f(path);
    return std::string((std::istreambuf_iterator<char>(f)),
                       std::istreambuf_iterator<char>());
  };
  cli->warn("written to first file");
  for (int attempt = 0; attempt < 500; ++attempt) {
    cli->flush();
    if (read(first).find("written to first file") != std::string::npos) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  prmerge::init_logger(spdlog::level::info, "", second, 0);
  cli->warn("written to second file");
  spdlog::shutdown();

  std::string first_content = read(first);
  std::string second_content = read(second);
  REQUIRE(first_content.find("written to first file") != std::string::npos);
  REQUIRE(first_content.find("written to second file") == std::string::npos);
  REQUIRE(second_content.find("written to second file") != std::string::npos);
  REQUIRE(second_content.find("written to first file") == std::string::npos);
  std::remove(first);
  std::remove(second);
}
