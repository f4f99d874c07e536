#include "core/config.hpp"
#include "core/logging.hpp"
#include "engine/detection_scheduler.hpp"
#include "input/dataset_loader.hpp"
#include "output/console_logger.hpp"
#include "output/csv_exporter.hpp"
#include "output/json_formatter.hpp"
#include "review/anomaly_review.hpp"
#include "storage/memory_storage.hpp"
#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " -d <dataset.json> [options]\n"
              << "\nOptions:\n"
              << "  -d, --dataset <path>   Canonical vendor/bill dataset (JSON)\n"
              << "  -c, --config <path>    Load configuration from JSON file\n"
              << "  -t, --tenant <id>      Run a single tenant (default: all tenants)\n"
              << "      --today <date>     Run as of YYYY-MM-DD (default: current UTC date)\n"
              << "      --json <path>      Write run summaries and findings as JSON\n"
              << "      --csv <path>       Write findings as CSV\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  APWATCH_ALERT_MIN_AMOUNT       Alert floor amount\n"
              << "  APWATCH_ALERT_SIGMA_THRESHOLD  Outlier threshold in standard deviations\n"
              << "  APWATCH_DUPLICATE_DAY_WINDOW   Duplicate window in days\n"
              << "  APWATCH_BASELINE_DAYS          Baseline window in days\n"
              << "  APWATCH_LOG_LEVEL              trace|debug|info|warn|error|critical|off\n"
              << "  APWATCH_WORKER_THREADS         Tenant runner pool size\n"
              << "\nConfig priority: Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "apwatch v1.0.0\n"
              << "Accounts-payable anomaly detection\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> dataset_path;
    std::optional<std::string> config_path;
    std::optional<std::string> tenant;
    std::optional<std::string> today;
    std::optional<std::string> json_path;
    std::optional<std::string> csv_path;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-d" || arg == "--dataset") && i + 1 < argc) {
            args.dataset_path = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-t" || arg == "--tenant") && i + 1 < argc) {
            args.tenant = argv[++i];
        } else if (arg == "--today" && i + 1 < argc) {
            args.today = argv[++i];
        } else if (arg == "--json" && i + 1 < argc) {
            args.json_path = argv[++i];
        } else if (arg == "--csv" && i + 1 < argc) {
            args.csv_path = argv[++i];
        }
    }

    return args;
}

std::optional<apwatch::TenantId> parse_tenant(const std::string& s) {
    apwatch::TenantId id = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
    if (ec != std::errc{} || ptr != s.data() + s.size() || id == 0) {
        return std::nullopt;
    }
    return id;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace apwatch;

    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    if (!args.dataset_path) {
        std::cerr << "Error: --dataset is required\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Load configuration with priority: env > file > defaults
    auto config = Config::load(args.config_path);
    setup_logging(config.logging);

    Date today = dates::today();
    if (args.today) {
        auto parsed = dates::parse_iso(*args.today);
        if (parsed.is_err()) {
            spdlog::error("Invalid --today value: {}", parsed.error().message);
            return 1;
        }
        today = parsed.value();
    }

    try {
        auto dataset = DatasetLoader::load_file(*args.dataset_path);
        if (dataset.is_err()) {
            spdlog::error("Failed to load dataset: {}", dataset.error().to_string());
            return 1;
        }

        MemoryStorage storage;
        for (const auto& records : dataset.value().tenants) {
            auto imported = storage.import(records);
            if (imported.is_err()) {
                spdlog::error("Failed to import tenant {}: {}",
                              records.tenant.id, imported.error().to_string());
                return 1;
            }
            spdlog::info("Imported tenant {} ({} vendors, {} bills)", records.tenant.id,
                         imported.value().vendors, imported.value().bills);
        }

        std::vector<TenantId> tenants;
        if (args.tenant) {
            auto id = parse_tenant(*args.tenant);
            if (!id) {
                spdlog::error("Invalid --tenant value: {}", *args.tenant);
                return 1;
            }
            tenants.push_back(*id);
        } else {
            for (const auto& tenant : storage.tenants()) {
                tenants.push_back(tenant.id);
            }
        }

        spdlog::info("Running detection for {} tenant(s) as of {}", tenants.size(), dates::to_iso(today));

        DetectionOrchestrator orchestrator(storage, config.detection);
        std::vector<TenantRunResult> results;
        {
            DetectionScheduler scheduler(orchestrator, config.runner.worker_threads);
            results = scheduler.run_all(tenants, today);
        }

        AnomalyReview review(storage);
        auto json_out = nlohmann::json::array();
        std::vector<AnomalyRow> csv_rows;
        bool failed = false;

        for (const auto& run : results) {
            if (run.result.is_err()) {
                output::ConsoleLogger::log_failure(run.tenant_id, run.result.error());
                failed = true;
                continue;
            }

            const auto& summary = run.result.value();
            output::ConsoleLogger::log_run_summary(summary);
            for (const auto& anomaly : review.pending_alerts(run.tenant_id)) {
                output::ConsoleLogger::log_anomaly(anomaly);
            }
            auto stats = review.dashboard(run.tenant_id);
            output::ConsoleLogger::log_dashboard(stats);

            auto rows = review.export_rows(run.tenant_id);
            json_out.push_back({
                {"run", output::JsonFormatter::format_run_summary(summary)},
                {"dashboard", output::JsonFormatter::format_dashboard(stats)},
                {"anomalies", output::JsonFormatter::format_rows(rows)}
            });
            csv_rows.insert(csv_rows.end(), rows.begin(), rows.end());
        }

        if (args.json_path) {
            std::ofstream file(*args.json_path);
            if (!file) {
                spdlog::error("Failed to open JSON output: {}", *args.json_path);
                return 1;
            }
            file << json_out.dump(2) << '\n';
            spdlog::info("Wrote {}", *args.json_path);
        }

        if (args.csv_path) {
            std::ofstream file(*args.csv_path, std::ios::binary);
            if (!file) {
                spdlog::error("Failed to open CSV output: {}", *args.csv_path);
                return 1;
            }
            output::CsvExporter::write(file, csv_rows);
            spdlog::info("Wrote {} ({} rows)", *args.csv_path, csv_rows.size());
        }

        spdlog::shutdown();
        return failed ? 1 : 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        spdlog::shutdown();
        return 1;
    }
}
