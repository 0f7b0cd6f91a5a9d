#ifndef PIIREDACTOR_UTIL_CONFIG_PARSER_HPP
#define PIIREDACTOR_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <limits>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>
#include "config/pipeline_config.hpp"
#include "config/entity_defaults.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief A minimal parser for pii_redactor's PipelineConfig.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - Populate piiredactor::config::PipelineConfig fields.
 *   - This is header-only and does not rely on external libraries.
 *   - Lines starting with '#' and blank lines are skipped. Unknown keys are logged
 *     and ignored; malformed lines and values throw ConfigError.
 *
 * Recognized keys:
 *   preset, reversible, shareMapping, entities, scoreThreshold, allowList,
 *   operator.<TYPE>, mismatchPolicy, contextWindow, workerThreads, logLevel, logFile,
 *   detectorUrl, detectorLanguage, detectorTimeoutSeconds, resultStorePath
 *
 * USAGE:
 *   @code
 *   piiredactor::config::PipelineConfig cfg;
 *   piiredactor::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("pii_redactor.conf");
 *   @endcode
 *
 *   # pii_redactor.conf
 *   reversible=true
 *   entities=PERSON,LOCATION,EMAIL_ADDRESS
 *   operator.EMAIL_ADDRESS=replace:<email>
 *   allowList=Αθήνα
 */

namespace piiredactor {
namespace util {

class ConfigParser
{
public:
    /**
     * @param pipelineConfig The PipelineConfig to populate. Fields not named in the
     *        file keep their current values.
     */
    explicit ConfigParser(config::PipelineConfig &pipelineConfig)
        : pipelineConfig_(pipelineConfig)
    {
    }

    /**
     * @brief Read the given file line by line into the config.
     *        A missing file is logged and leaves the defaults in place.
     * @throw ConfigError on a malformed line or value.
     */
    void loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath);
            return;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        parseStream(inFile);
        logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Same as loadFromFile, over in-memory text.
     */
    void loadFromString(const std::string &content)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::istringstream in(content);
        parseStream(in);
    }

private:
    config::PipelineConfig &pipelineConfig_;
    std::mutex mutex_;

    void parseStream(std::istream &in)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            // Skip comments (# at line start) or blank lines
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw ConfigError("line " + std::to_string(lineNo) + ": no '=' in '" + line + "'");
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) {
                throw ConfigError("line " + std::to_string(lineNo) + ": empty key");
            }

            applyKeyValue(key, val);
        }
    }

    void applyKeyValue(const std::string &key, const std::string &val)
    {
        config::PipelineConfig &cfg = pipelineConfig_;
        const std::string operatorPrefix = "operator.";

        if (key == "preset") {
            config::EntityDefaults preset;
            if (!config::findPreset(val, preset)) {
                throw ConfigError("unknown preset '" + val + "'");
            }
            cfg.applyPreset(preset);
            logger::debug("ConfigParser: preset set to " + val);
        }
        else if (key == "reversible") {
            cfg.reversible = parseBool(key, val);
            logger::debug("ConfigParser: reversible set to " + val);
        }
        else if (key == "shareMapping") {
            cfg.shareMapping = parseBool(key, val);
            logger::debug("ConfigParser: shareMapping set to " + val);
        }
        else if (key == "entities") {
            std::vector<std::string> items = splitList(val);
            cfg.entities.clear();
            cfg.entities.insert(items.begin(), items.end());
            logger::debug("ConfigParser: entities set to " + val);
        }
        else if (key == "scoreThreshold") {
            cfg.scoreThreshold = parseDouble(key, val);
            if (cfg.scoreThreshold < 0.0 || cfg.scoreThreshold > 1.0) {
                throw ConfigError("scoreThreshold must lie in [0, 1], got '" + val + "'");
            }
            logger::debug("ConfigParser: scoreThreshold set to " + val);
        }
        else if (key == "allowList") {
            std::vector<std::string> items = splitList(val);
            cfg.allowList.clear();
            cfg.allowList.insert(items.begin(), items.end());
            // values are not logged: allow-list entries may themselves be names
            logger::debug("ConfigParser: allowList set (" + std::to_string(items.size()) + " entries)");
        }
        else if (key.compare(0, operatorPrefix.size(), operatorPrefix) == 0) {
            const std::string type = key.substr(operatorPrefix.size());
            if (type.empty()) {
                throw ConfigError("operator key without an entity type");
            }
            validateOperator(val);
            cfg.operators[type] = val;
            logger::debug("ConfigParser: operator for " + type + " set");
        }
        else if (key == "mismatchPolicy") {
            if (val == "realign") cfg.mismatchPolicy = config::MismatchPolicy::Realign;
            else if (val == "drop_spans") cfg.mismatchPolicy = config::MismatchPolicy::DropSpans;
            else if (val == "fail") cfg.mismatchPolicy = config::MismatchPolicy::Fail;
            else throw ConfigError("mismatchPolicy must be realign, drop_spans or fail, got '" + val + "'");
            logger::debug("ConfigParser: mismatchPolicy set to " + val);
        }
        else if (key == "contextWindow") {
            cfg.contextWindow = parseUInt32(key, val);
            if (cfg.contextWindow == 0) {
                throw ConfigError("contextWindow must be positive");
            }
            logger::debug("ConfigParser: contextWindow set to " + val);
        }
        else if (key == "workerThreads") {
            cfg.workerThreads = parseUInt32(key, val);
            logger::debug("ConfigParser: workerThreads set to " + val);
        }
        else if (key == "logLevel") {
            try {
                logger::parseLogLevel(val);
            } catch (const std::invalid_argument &ex) {
                throw ConfigError(ex.what());
            }
            cfg.logLevel = val;
        }
        else if (key == "logFile") {
            cfg.logFile = val;
        }
        else if (key == "detectorUrl") {
            cfg.detectorUrl = val;
            logger::debug("ConfigParser: detectorUrl set to " + val);
        }
        else if (key == "detectorLanguage") {
            cfg.detectorLanguage = val;
        }
        else if (key == "detectorTimeoutSeconds") {
            cfg.detectorTimeoutSeconds = parseUInt32(key, val);
        }
        else if (key == "resultStorePath") {
            cfg.resultStorePath = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
        }
    }

    static void validateOperator(const std::string &val)
    {
        if (val == "keep" || val == "placeholder" || val == "counter" ||
            val.compare(0, 8, "replace:") == 0) {
            return;
        }
        throw ConfigError("operator must be keep, placeholder, counter or replace:<value>, got '" + val + "'");
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        s.erase(pos + 1);
    }

    static std::vector<std::string> splitList(const std::string &val)
    {
        std::vector<std::string> out;
        std::stringstream ss(val);
        std::string item;
        while (std::getline(ss, item, ',')) {
            trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
        return out;
    }

    static bool parseBool(const std::string &key, const std::string &val)
    {
        std::string lower(val);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes") return true;
        if (lower == "false" || lower == "0" || lower == "no") return false;
        throw ConfigError(key + ": expected a boolean, got '" + val + "'");
    }

    static uint32_t parseUInt32(const std::string &key, const std::string &val)
    {
        const uint64_t v = parseUInt(key, val);
        if (v > std::numeric_limits<uint32_t>::max()) {
            throw ConfigError(key + ": value '" + val + "' is out of range");
        }
        return static_cast<uint32_t>(v);
    }

    static uint64_t parseUInt(const std::string &key, const std::string &val)
    {
        if (val.empty() || val[0] == '-') {
            throw ConfigError(key + ": expected an unsigned integer, got '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw ConfigError(key + ": non-numeric suffix in '" + val + "'");
            }
            return n;
        }
        catch (const std::logic_error &ex) {
            throw ConfigError(key + ": parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    static double parseDouble(const std::string &key, const std::string &val)
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw ConfigError(key + ": non-numeric suffix in '" + val + "'");
            }
            return d;
        }
        catch (const std::logic_error &ex) {
            throw ConfigError(key + ": parseDouble failed on '" + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace piiredactor

#endif // PIIREDACTOR_UTIL_CONFIG_PARSER_HPP
