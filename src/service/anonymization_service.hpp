#ifndef PIIREDACTOR_SERVICE_ANONYMIZATION_SERVICE_HPP
#define PIIREDACTOR_SERVICE_ANONYMIZATION_SERVICE_HPP

#include <string>
#include <vector>
#include <set>
#include <map>
#include <memory>
#include <mutex>
#include <future>
#include <chrono>
#include <utility>
#include "config/pipeline_config.hpp"
#include "core/detector.hpp"
#include "core/errors.hpp"
#include "core/paragraph_pipeline.hpp"
#include "store/result_store.hpp"
#include "util/hashing.hpp"
#include "util/json.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

namespace piiredactor {
namespace service {

/**
 * @struct AnonymizationRequest
 * @brief One submitted text plus optional per-request overrides of the configured
 *        entity list, score threshold and allow-list.
 */
struct AnonymizationRequest
{
    std::string text;
    std::set<std::string> entities;        ///< empty = configured entities
    bool hasScoreThreshold = false;
    double scoreThreshold = 0.0;
    std::set<std::string> allowList;       ///< merged with the configured allow-list
};

/**
 * @brief Parse {"text": "...", "entities": [...], "score_threshold": 0.5,
 *        "allow_list": [...]}. Only "text" is required.
 * @throw InvalidSpan on malformed JSON or a missing/ill-typed field.
 */
inline AnonymizationRequest parseAnonymizationRequest(const std::string &json)
{
    AnonymizationRequest req;
    try {
        util::json::JsonValue doc = util::json::parse(json);
        req.text = doc.at("text").asString();
        if (doc.contains("entities") && !doc.at("entities").isNull()) {
            for (const auto &e : doc.at("entities").items()) {
                req.entities.insert(e.asString());
            }
        }
        if (doc.contains("score_threshold") && !doc.at("score_threshold").isNull()) {
            req.hasScoreThreshold = true;
            req.scoreThreshold = doc.at("score_threshold").asNumber();
        }
        if (doc.contains("allow_list") && !doc.at("allow_list").isNull()) {
            for (const auto &a : doc.at("allow_list").items()) {
                req.allowList.insert(a.asString());
            }
        }
    } catch (const std::runtime_error &ex) {
        throw InvalidSpan(std::string("malformed anonymization request: ") + ex.what());
    }
    return req;
}

/**
 * @struct JobInfo
 * @brief What a client polls for: {"anonymization_id","status","result"}.
 */
struct JobInfo
{
    std::string anonymizationId;
    store::JobStatus status = store::JobStatus::Pending;
    util::json::JsonValue result;   ///< records array on SUCCESS, {"error": ...} on FAILURE

    util::json::JsonValue toJson() const
    {
        util::json::JsonValue out = util::json::JsonValue::object();
        out.set("anonymization_id", anonymizationId);
        out.set("status", store::toString(status));
        out.set("result", result);
        return out;
    }
};

/*
  AnonymizationService
  --------------------------------
  Accepts texts, anonymizes them in the background and keeps the outcome in a
  ResultStore until polled.

    Submit(request)  -> job id, immediately; the job starts PENDING
    GetJob(id)       -> {anonymization_id, status, result}
    Wait(id)         -> block until the job has finished

  Jobs always run non-reversible: the store must never hold an entity mapping.
  Any exception inside a job is logged and turns the job into FAILURE.
*/
class AnonymizationService
{
public:
    AnonymizationService(const config::PipelineConfig &cfg,
                         std::shared_ptr<store::ResultStore> resultStore,
                         std::vector<std::shared_ptr<const core::Detector>> detectors = {},
                         size_t jobWorkers = 2)
        : m_config(cfg),
          m_store(std::move(resultStore)),
          m_detectors(std::move(detectors)),
          m_pool(jobWorkers)
    {
        if (!m_store) {
            throw StoreError("AnonymizationService needs a ResultStore");
        }
        if (m_config.reversible) {
            util::logger::warn("AnonymizationService: reversible mode is not available for stored jobs; disabled");
            m_config.reversible = false;
        }
    }

    std::string Submit(const std::string &text)
    {
        AnonymizationRequest req;
        req.text = text;
        return Submit(req);
    }

    std::string Submit(const AnonymizationRequest &request)
    {
        // built before the job exists, so a bad override fails the submit itself
        auto pipeline = std::make_shared<core::ParagraphPipeline>(configFor(request), m_detectors);

        const std::string jobId = util::hashing::newJobId(request.text);
        m_store->CreateJob(jobId);
        std::shared_ptr<store::ResultStore> resultStore = m_store;
        const std::string text = request.text;

        std::future<void> done = m_pool.enqueue([pipeline, resultStore, jobId, text]() {
            util::logger::Scope scope("job " + jobId.substr(0, 8));
            try {
                std::vector<core::AnonymizationRecord> records = pipeline->Anonymize(text);
                resultStore->StoreRecords(jobId, records);
                util::logger::info("AnonymizationService: SUCCESS");
            } catch (const std::exception &ex) {
                util::logger::error(std::string("AnonymizationService: FAILURE: ") + ex.what());
                resultStore->MarkFailed(jobId, ex.what());
            }
        });

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pruneFinishedLocked();
            m_pending.emplace(jobId, done.share());
        }
        util::logger::info("AnonymizationService: job " + jobId + " submitted [" +
                           util::hashing::fingerprint(text) + "], " +
                           std::to_string(m_pool.pending()) + " queued");
        return jobId;
    }

    /**
     * @brief Current state of a job.
     * @return false if the id is unknown.
     */
    bool GetJob(const std::string &jobId, JobInfo &out)
    {
        store::JobRow row;
        if (!m_store->GetJob(jobId, row)) {
            return false;
        }
        out = JobInfo();
        out.anonymizationId = jobId;
        out.status = row.status;
        if (row.status == store::JobStatus::Success) {
            out.result = util::json::parse(row.resultJson);
        } else if (row.status == store::JobStatus::Failure) {
            out.result = util::json::JsonValue::object();
            out.result.set("error", row.error);
        }
        return true;
    }

    /**
     * @brief Block until the job has left PENDING, or the timeout expires.
     *        A job that is no longer tracked is answered from the store.
     * @return true if the job finished in time.
     */
    bool Wait(const std::string &jobId,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    {
        std::shared_future<void> done;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_pending.find(jobId);
            if (it == m_pending.end()) {
                store::JobRow row;
                return m_store->GetJob(jobId, row) && row.status != store::JobStatus::Pending;
            }
            done = it->second;
        }
        if (done.wait_for(timeout) != std::future_status::ready) {
            return false;
        }
        done.get();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pending.erase(jobId);
        }
        return true;
    }

    /// Jobs submitted whose completion has not been observed yet.
    size_t TrackedJobs() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.size();
    }

private:
    void pruneFinishedLocked()
    {
        for (auto it = m_pending.begin(); it != m_pending.end();) {
            if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                it = m_pending.erase(it);
            } else {
                ++it;
            }
        }
    }

    config::PipelineConfig configFor(const AnonymizationRequest &request) const
    {
        config::PipelineConfig cfg = m_config;
        if (!request.entities.empty()) {
            cfg.entities = request.entities;
        }
        if (request.hasScoreThreshold) {
            cfg.scoreThreshold = request.scoreThreshold;
        }
        cfg.allowList.insert(request.allowList.begin(), request.allowList.end());
        return cfg;
    }

    config::PipelineConfig m_config;
    std::shared_ptr<store::ResultStore> m_store;
    std::vector<std::shared_ptr<const core::Detector>> m_detectors;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_future<void>> m_pending;   // jobs until their completion is seen
    util::ThreadPool m_pool;   // last: joined before the members its tasks use
};

} // namespace service
} // namespace piiredactor

#endif // PIIREDACTOR_SERVICE_ANONYMIZATION_SERVICE_HPP
