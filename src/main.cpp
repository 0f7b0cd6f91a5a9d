#include <getopt.h>
#include <unistd.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/pipeline_config.hpp"
#include "core/detector.hpp"
#include "core/paragraph_pipeline.hpp"
#include "detectors/remote_detector.hpp"
#include "service/anonymization_service.hpp"
#include "service/record_serializer.hpp"
#include "store/result_store.hpp"
#include "util/config_parser.hpp"
#include "util/json.hpp"
#include "util/logger.hpp"

namespace {

using namespace piiredactor;

struct Options {
    std::string text;
    bool hasText = false;
    std::string inputFile;
    std::string outputFile;
    std::string configFile;
    std::string spansFile;
    std::string detectorUrl;
    std::string logLevel;
    std::string deanonymizeFile;
    bool reversible = false;
    bool job = false;
};

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "  -t, --text <text>            text to anonymize\n"
              << "  -i, --input-file <path>      read the text from a file (default: stdin)\n"
              << "  -o, --output-file <path>     write the JSON result to a file (default: stdout)\n"
              << "  -c, --config <path>          key=value configuration file\n"
              << "  -s, --spans-file <path>      use these spans instead of running detectors\n"
              << "  -d, --detector-url <url>     analyzer service base URL\n"
              << "  -r, --reversible             counter placeholders plus entity mapping\n"
              << "  -l, --log-level <level>      DEBUG, INFO, WARN, ERROR or CRITICAL\n"
              << "  -D, --deanonymize <path>     restore the text of a reversible record file\n"
              << "  -j, --job                    run as a stored anonymization job\n"
              << "  -h, --help                   show this help\n";
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeOutput(const std::string& path, const std::string& content) {
    if (path.empty()) {
        std::cout << content << std::endl;
        return;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write " + path);
    }
    out << content << '\n';
    if (!out) {
        throw std::runtime_error("write to " + path + " failed");
    }
}

std::string deanonymizeRecords(const std::string& json) {
    util::json::JsonValue doc = util::json::parse(json);
    std::vector<util::json::JsonValue> items;
    if (doc.isArray()) {
        items = doc.items();
    } else {
        items.push_back(doc);
    }

    std::string restored;
    for (size_t i = 0; i < items.size(); ++i) {
        core::AnonymizationRecord record = service::recordFromJson(items[i]);
        if (i) {
            restored += '\n';
        }
        restored += core::ParagraphPipeline::Deanonymize(record);
    }
    return restored;
}

int run(const Options& opts) {
    config::PipelineConfig cfg;
    if (!opts.configFile.empty()) {
        util::ConfigParser parser(cfg);
        parser.loadFromFile(opts.configFile);
    }
    if (!opts.detectorUrl.empty()) {
        cfg.detectorUrl = opts.detectorUrl;
    }
    if (opts.reversible) {
        cfg.reversible = true;
    }
    if (!opts.logLevel.empty()) {
        cfg.logLevel = opts.logLevel;
    }

    util::logger::setLogLevel(util::logger::parseLogLevel(cfg.logLevel));
    if (!cfg.logFile.empty() && !util::logger::enableFileOutput(cfg.logFile)) {
        util::logger::warn("[main] Could not open log file " + cfg.logFile);
    }

    if (!opts.deanonymizeFile.empty()) {
        util::logger::info("[main] Restoring text from " + opts.deanonymizeFile);
        writeOutput(opts.outputFile, deanonymizeRecords(readFile(opts.deanonymizeFile)));
        return 0;
    }

    std::string text;
    if (opts.hasText) {
        text = opts.text;
    } else if (!opts.inputFile.empty()) {
        text = readFile(opts.inputFile);
    } else {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::vector<std::shared_ptr<const core::Detector>> active;
    if (!cfg.detectorUrl.empty()) {
        active.push_back(std::make_shared<detectors::RemoteDetector>(
            cfg.detectorUrl, cfg.detectorLanguage, cfg.entities,
            static_cast<long>(cfg.detectorTimeoutSeconds)));
    }

    if (opts.job) {
        if (!opts.spansFile.empty()) {
            throw std::runtime_error("--spans-file cannot be combined with --job");
        }
        auto resultStore = std::make_shared<store::ResultStore>(cfg.resultStorePath);
        service::AnonymizationService svc(cfg, resultStore, active, 1);
        const std::string jobId = svc.Submit(text);
        if (!svc.Wait(jobId)) {
            throw std::runtime_error("job " + jobId + " did not finish in time");
        }
        service::JobInfo info;
        if (!svc.GetJob(jobId, info)) {
            throw std::runtime_error("job " + jobId + " vanished from " + cfg.resultStorePath);
        }
        writeOutput(opts.outputFile, info.toJson().dump(4));
        return info.status == store::JobStatus::Success ? 0 : 1;
    }

    if (active.empty() && opts.spansFile.empty()) {
        util::logger::warn("[main] No detector URL and no spans file: nothing will be masked.");
    }

    core::ParagraphPipeline pipeline(cfg, active);
    std::vector<core::AnonymizationRecord> records;
    if (!opts.spansFile.empty()) {
        records = pipeline.AnonymizeWithSpans(text, service::parseSpansFile(readFile(opts.spansFile)));
    } else {
        records = pipeline.Anonymize(text);
    }

    writeOutput(opts.outputFile, service::recordsToJson(records).dump(4));
    util::logger::info("[main] Wrote " + std::to_string(records.size()) + " record(s).");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    static struct option long_options[] = {
        {"text", required_argument, 0, 't'},
        {"input-file", required_argument, 0, 'i'},
        {"output-file", required_argument, 0, 'o'},
        {"config", required_argument, 0, 'c'},
        {"spans-file", required_argument, 0, 's'},
        {"detector-url", required_argument, 0, 'd'},
        {"reversible", no_argument, 0, 'r'},
        {"log-level", required_argument, 0, 'l'},
        {"deanonymize", required_argument, 0, 'D'},
        {"job", no_argument, 0, 'j'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0},
    };

    Options opts;
    int c;
    int option_index = 0;
    while ((c = getopt_long(argc, argv, "t:i:o:c:s:d:rl:D:jh", long_options, &option_index)) != -1) {
        switch (c) {
        case 't':
            opts.text = optarg;
            opts.hasText = true;
            break;
        case 'i':
            opts.inputFile = optarg;
            break;
        case 'o':
            opts.outputFile = optarg;
            break;
        case 'c':
            opts.configFile = optarg;
            break;
        case 's':
            opts.spansFile = optarg;
            break;
        case 'd':
            opts.detectorUrl = optarg;
            break;
        case 'r':
            opts.reversible = true;
            break;
        case 'l':
            opts.logLevel = optarg;
            break;
        case 'D':
            opts.deanonymizeFile = optarg;
            break;
        case 'j':
            opts.job = true;
            break;
        case 'h':
            printUsage(argv[0]);
            return 0;
        default:
            printUsage(argv[0]);
            return 1;
        }
    }
    if (optind < argc) {
        std::cerr << "unexpected argument: " << argv[optind] << "\n";
        printUsage(argv[0]);
        return 1;
    }

    try {
        return run(opts);
    } catch (const std::exception& ex) {
        piiredactor::util::logger::error(std::string("[main] ") + ex.what());
        return 1;
    }
}
