#include "adapter/param_validator.hpp"
#include "adapter/service_operation.hpp"
#include "common/error_handling.hpp"
#include "common/logger.hpp"
#include "runtime/runtime_config.hpp"
#include "runtime/service_runtime.hpp"
#include <filesystem>
#include <iostream>
#include <string>

using namespace warden;

namespace fs = std::filesystem;

struct InventoryParams {
    std::string root;
    bool recursive = true;
};

struct Inventory {
    std::string root;
    u64 files = 0;
    u64 bytes = 0;
    bool complete = true;
};

// Counts regular files and their total size below a directory
class ProjectInventory : public adapter::ServiceOperation<InventoryParams, Inventory> {
public:
    std::string name() const override { return "project_inventory"; }
    std::string description() const override { return "Counts files and bytes below a project root"; }
    cache::CacheLayer cache_layer() const override { return cache::CacheLayer::PROJECT_ANALYSIS; }

    InventoryParams validate_input(const Json::Value& raw) const override {
        adapter::ParamValidator validator;
        validator.required("root", adapter::ParamValidator::FieldType::STRING)
                 .min_length("root", 1)
                 .optional("recursive", adapter::ParamValidator::FieldType::BOOLEAN);
        validator.validate_or_throw(raw, name());

        return {raw["root"].asString(), raw.get("recursive", true).asBool()};
    }

    std::string cache_key(const InventoryParams& params) const override {
        return params.root + (params.recursive ? ":r" : ":flat");
    }

    Json::Value execute_core(const InventoryParams& params, const adapter::ToolContext&) override {
        u64 files = 0;
        u64 bytes = 0;

        auto count = [&](const fs::directory_entry& entry) {
            if (entry.is_regular_file()) {
                ++files;
                bytes += entry.file_size();
            }
        };

        if (params.recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(params.root)) count(entry);
        } else {
            for (const auto& entry : fs::directory_iterator(params.root)) count(entry);
        }

        Json::Value raw(Json::objectValue);
        raw["root"] = params.root;
        raw["files"] = static_cast<Json::UInt64>(files);
        raw["bytes"] = static_cast<Json::UInt64>(bytes);
        return raw;
    }

    Inventory transform_output(const Json::Value& raw) const override {
        return {raw["root"].asString(), raw["files"].asUInt64(), raw["bytes"].asUInt64(), true};
    }

    std::optional<Inventory> execute_partial(const InventoryParams& params,
                                             const adapter::ToolContext& context) override {
        InventoryParams flat = params;
        flat.recursive = false;
        Inventory inventory = transform_output(execute_core(flat, context));
        inventory.complete = false;
        return inventory;
    }

    std::optional<Inventory> default_result(const InventoryParams& params) const override {
        return Inventory{params.root, 0, 0, false};
    }

    std::optional<Json::Value> health_check_params() const override {
        Json::Value params(Json::objectValue);
        params["root"] = ".";
        params["recursive"] = false;
        return params;
    }
};

void print(const adapter::ExecutionResult<Inventory>& result) {
    std::cout << "  " << result.value.root << ": " << result.value.files << " files, "
              << result.value.bytes << " bytes"
              << " [" << adapter::execution_status_to_string(result.status) << "]"
              << (result.value.complete ? "" : " (incomplete)") << "\n";
}

int main(int argc, char* argv[]) {
    runtime::RuntimeConfig config;
    try {
        if (argc > 1) {
            config = runtime::RuntimeConfig::from_file(argv[1]);
        }
    } catch (const ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (!config.configure_logger) {
        common::Logger::Config log_config;
        log_config.level = common::LogLevel::WARNING;
        common::Logger::initialize("warden-demo", log_config);
    }

    runtime::ServiceRuntime service_runtime(config);
    service_runtime.start();

    adapter::FallbackConfig fallback = config.fallback;
    fallback.fallback_chain = {adapter::FallbackStrategy::CACHE,
                               adapter::FallbackStrategy::PARTIAL,
                               adapter::FallbackStrategy::DEFAULT};
    fallback.max_retries = 1;
    fallback.retry_delay = Milliseconds(100);
    auto inventory = service_runtime.make_adapter<InventoryParams, Inventory>(
        std::make_shared<ProjectInventory>(), fallback);

    std::cout << "=== Project inventory ===\n";
    Json::Value params(Json::objectValue);
    params["root"] = argc > 2 ? argv[2] : ".";

    try {
        print(inventory->execute(params));
        print(inventory->execute(params));

        params["root"] = "/nonexistent/warden-demo";
        print(inventory->execute(params));

        Json::Value invalid(Json::objectValue);
        invalid["recursive"] = "yes";
        inventory->execute(invalid);
    } catch (const resilience::ServiceError& e) {
        std::cout << "  rejected: " << e.error().code << " " << e.what() << "\n";
    }

    auto health = inventory->health_check();
    std::cout << "\n=== Health ===\n"
              << "  " << inventory->name() << ": " << health.status << " (" << health.details << ")\n"
              << "  runtime healthy: " << (service_runtime.is_healthy() ? "yes" : "no") << "\n";

    std::cout << "\n=== Metrics ===\n" << service_runtime.export_prometheus_metrics();

    service_runtime.shutdown();
    if (!config.configure_logger) {
        common::Logger::shutdown();
    }
    return 0;
}
