#include <spdlog/spdlog.h>

#include <boost/asio/thread_pool.hpp>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>

#include "exp1.hpp"
#include "exp2.hpp"
#include "exp_params.hpp"

boost::asio::thread_pool globalThreadPool{std::thread::hardware_concurrency()};

// ##### Main function ####
int main(int argc, char* argv[]) {
  try {
    ExperimentParams params = parseExperimentArgs(argc, argv);
    if (params.verbose) {
      spdlog::set_level(spdlog::level::debug);
    }

    std::filesystem::create_directories(params.csvDir);
    std::filesystem::create_directories(params.dbDir);

    if (params.experiment == "1" || params.experiment == "all") {
      runExp1(params);
    }
    if (params.experiment == "2" || params.experiment == "all") {
      runExp2(params);
    }
  } catch (const std::exception& e) {
    spdlog::error("[Error] {}", e.what());
    globalThreadPool.join();
    return EXIT_FAILURE;
  }

  globalThreadPool.join();
  return EXIT_SUCCESS;
}
