#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/pii_registry.hpp"
#include "detection/entity_source.hpp"
#include "detection/remote_entity_source.hpp"
#include "pipeline/anonymizer.hpp"
#include "pipeline/batch_runner.hpp"
#include "util/config_parser.hpp"
#include "util/json.hpp"
#include "util/logger.hpp"

namespace logger = piiguard::util::logger;

// Reads one document per line from stdin and writes one JSON object per
// document to stdout:
//   {"index":0,"text":"...","audit":{...}}   or   {"index":1,"error":"..."}
// Exit codes: 0 all documents anonymized, 1 bad configuration, 2 some documents failed.
int main(int argc, char** argv) {
    logger::setLogLevel(logger::LogLevel::INFO);

    // 1. Parse configuration
    piiguard::config::AnonymizerConfig config;
    std::string configPath = "piiguard.conf";
    if (argc > 1) {
        configPath = argv[1];
    }

    std::unique_ptr<piiguard::core::PiiRegistry> registry;
    piiguard::detection::OffsetUnit offsetUnit = piiguard::detection::OffsetUnit::Byte;
    try {
        piiguard::util::ConfigParser configParser(config);
        configParser.loadFromFile(configPath);

        logger::setLogLevel(logger::parseLogLevel(config.logLevel));
        if (!config.logFile.empty()) {
            logger::enableFileOutput(config.logFile);
        }
        offsetUnit = piiguard::detection::parseOffsetUnit(config.nerOffsetUnit);

        // 2. Validate and compile the detector tables; refuse to start if anything is off
        registry = std::make_unique<piiguard::core::PiiRegistry>(
            piiguard::core::PiiRegistry::fromConfig(config));
    } catch (const std::exception& ex) {
        logger::critical(std::string("[main] Invalid configuration: ") + ex.what());
        return 1;
    }

    // 3. Entity model, built lazily on the first document
    std::unique_ptr<piiguard::detection::EntityModelHandle> model;
    if (!config.nerEndpoint.empty()) {
        piiguard::detection::RemoteEntitySourceOptions options;
        options.endpoint = config.nerEndpoint;
        options.timeoutSeconds = static_cast<long>(config.nerTimeoutSeconds);
        options.offsetUnit = offsetUnit;
        model = std::make_unique<piiguard::detection::EntityModelHandle>([options] {
            return std::make_unique<piiguard::detection::RemoteEntitySource>(options);
        });
    } else {
        logger::warn("[main] No ner.endpoint configured, running on pattern detectors only.");
    }

    piiguard::pipeline::Anonymizer anonymizer(*registry, model.get(), config.documentDigest);
    piiguard::pipeline::BatchRunner runner(anonymizer, config.workers,
                                           std::chrono::milliseconds(config.documentTimeoutMs));

    // 4. Read documents
    std::vector<std::string> documents;
    std::string line;
    while (std::getline(std::cin, line)) {
        documents.push_back(line);
    }
    logger::info("[main] Read " + std::to_string(documents.size()) + " documents, "
                 + std::to_string(runner.workerCount()) + " workers.");

    // 5. Anonymize and emit
    auto results = runner.run(documents);
    bool anyFailed = false;
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& item = results[i];
        std::cout << "{\"index\":" << i;
        if (item.ok) {
            std::cout << ",\"text\":\"" << piiguard::util::json::escapeString(item.text)
                      << "\",\"audit\":" << item.auditLog.toJson();
        } else {
            anyFailed = true;
            std::cout << ",\"error\":\"" << piiguard::util::json::escapeString(item.error) << "\"";
        }
        std::cout << "}\n";
    }
    std::cout.flush();

    return anyFailed ? 2 : 0;
}
