#include "backtest/backtest_runner.hpp"
#include "common/logging.hpp"
#include "config/config_loader.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string data_dir;
    std::string out_prefix;
    std::string log_level = "info";
    size_t synthetic_updates = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--data" && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (arg == "--synthetic" && i + 1 < argc) {
            try {
                synthetic_updates = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--synthetic expects a positive count\n";
                return 2;
            }
        } else if (arg == "--out" && i + 1 < argc) {
            out_prefix = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: mpmm_backtest [options]\n"
                      << "  --config <path>     JSON config file (defaults built in)\n"
                      << "  --data <dir>        Directory with lobs.csv and trades.csv\n"
                      << "  --synthetic <n>     Use n synthetic market updates instead of files\n"
                      << "  --out <prefix>      Prefix for CSV output and <prefix>_report.md\n"
                      << "  --log-level <lvl>   trace, debug, info, warn, error\n"
                      << "  --help              Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << " (see --help)\n";
            return 2;
        }
    }

    mpmm::init_logging(log_level);

    try {
        mpmm::BacktestConfig config;
        if (!config_path.empty()) {
            mpmm::logger()->info("loading config from {}", config_path);
            config = mpmm::load_config(config_path);
        }
        if (!data_dir.empty()) config.data_dir = data_dir;
        if (synthetic_updates > 0) {
            config.data_dir.clear();
            config.synthetic.num_updates = synthetic_updates;
        }
        if (!out_prefix.empty()) config.csv_prefix = out_prefix;

        mpmm::BacktestRunner runner(config);
        runner.run();

        const std::string report_path = config.csv_prefix + "_report.md";
        runner.write_report(report_path);
        runner.write_csv(config.csv_prefix);

        std::cout << "\n" << runner.result().log.generate_report();
        mpmm::logger()->info("results written to {} and {}_*.csv", report_path, config.csv_prefix);
    } catch (const std::exception& e) {
        mpmm::logger()->error("fatal: {}", e.what());
        return 1;
    }

    return 0;
}
