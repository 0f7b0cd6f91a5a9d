#ifndef PIIREDACTOR_RESULT_STORE_HPP
#define PIIREDACTOR_RESULT_STORE_HPP

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>
#include <zlib.h>
#include "core/anonymization_record.hpp"
#include "core/errors.hpp"
#include "service/record_serializer.hpp"
#include "util/logger.hpp"

namespace piiredactor {
namespace store {

enum class JobStatus { Pending, Success, Failure };

inline std::string toString(JobStatus status) {
    switch (status) {
    case JobStatus::Pending: return "PENDING";
    case JobStatus::Success: return "SUCCESS";
    case JobStatus::Failure: return "FAILURE";
    }
    return "PENDING";
}

inline JobStatus parseJobStatus(const std::string& text) {
    if (text == "PENDING") return JobStatus::Pending;
    if (text == "SUCCESS") return JobStatus::Success;
    if (text == "FAILURE") return JobStatus::Failure;
    throw StoreError("unknown job status '" + text + "'");
}

struct JobRow {
    std::string id;
    JobStatus status = JobStatus::Pending;
    std::string resultJson;   // decompressed; empty unless SUCCESS
    std::string error;        // set on FAILURE
};

/*
  ResultStore
  --------------------------------------------------------
  SQLite table of anonymization jobs. The result of a finished job is its
  records as JSON, zlib-compressed into a BLOB.

  Only non-reversible records are accepted: a reversible record carries an entity
  mapping, and mappings never leave the session that built them.

  All methods serialize on one mutex; failures throw StoreError.
*/
class ResultStore {
  public:
    explicit ResultStore(const std::string& dbFilePath) : m_dbFilePath(dbFilePath), m_db(nullptr) {
        if (sqlite3_open(m_dbFilePath.c_str(), &m_db) != SQLITE_OK || m_db == nullptr) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            if (m_db) {
                sqlite3_close(m_db);
                m_db = nullptr;
            }
            throw StoreError("could not open " + m_dbFilePath + ": " + msg);
        }
        initDatabaseSchema();
        util::logger::info("[ResultStore] Opened " + m_dbFilePath);
    }

    ~ResultStore() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    ResultStore(const ResultStore&) = delete;
    ResultStore& operator=(const ResultStore&) = delete;

    // -------------------------------------------------------------------------
    // New job in PENDING state
    // -------------------------------------------------------------------------
    void CreateJob(const std::string& jobId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "INSERT INTO jobs (id, status) VALUES (?, 'PENDING');");
        bindText(stmt, 1, jobId);
        stepDone(stmt, "CreateJob");
    }

    // -------------------------------------------------------------------------
    // Store the records of a finished job and mark it SUCCESS
    // -------------------------------------------------------------------------
    void StoreRecords(const std::string& jobId, const std::vector<core::AnonymizationRecord>& records) {
        for (const auto& r : records) {
            if (r.reversible) {
                throw StoreError("refusing to store a reversible record for job " + jobId);
            }
        }
        const std::string json = service::recordsToJson(records).dump();
        std::vector<uint8_t> compressed = compress(json);

        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db,
                       "UPDATE jobs SET status = 'SUCCESS', result = ?, raw_size = ?, error = NULL,"
                       " updated_at = CURRENT_TIMESTAMP WHERE id = ?;");
        if (sqlite3_bind_blob(stmt.get(), 1, compressed.data(), static_cast<int>(compressed.size()),
                              SQLITE_TRANSIENT) != SQLITE_OK ||
            sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(json.size())) != SQLITE_OK) {
            throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(m_db));
        }
        bindText(stmt, 3, jobId);
        stepDone(stmt, "StoreRecords");
        requireChanged(jobId);
    }

    // -------------------------------------------------------------------------
    // Mark a job FAILURE with a reason
    // -------------------------------------------------------------------------
    void MarkFailed(const std::string& jobId, const std::string& error) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db,
                       "UPDATE jobs SET status = 'FAILURE', error = ?, updated_at = CURRENT_TIMESTAMP"
                       " WHERE id = ?;");
        bindText(stmt, 1, error);
        bindText(stmt, 2, jobId);
        stepDone(stmt, "MarkFailed");
        requireChanged(jobId);
    }

    // -------------------------------------------------------------------------
    // Fetch a job; returns false if the id is unknown
    // -------------------------------------------------------------------------
    bool GetJob(const std::string& jobId, JobRow& out) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "SELECT status, result, raw_size, error FROM jobs WHERE id = ?;");
        bindText(stmt, 1, jobId);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return false;
        }
        if (rc != SQLITE_ROW) {
            throw StoreError(std::string("GetJob failed: ") + sqlite3_errmsg(m_db));
        }

        out = JobRow();
        out.id = jobId;
        out.status = parseJobStatus(columnText(stmt, 0));
        if (sqlite3_column_type(stmt.get(), 1) == SQLITE_BLOB) {
            const uint8_t* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt.get(), 1));
            int blobSize = sqlite3_column_bytes(stmt.get(), 1);
            sqlite3_int64 rawSize = sqlite3_column_int64(stmt.get(), 2);
            out.resultJson = decompress(blob, static_cast<size_t>(blobSize), static_cast<size_t>(rawSize));
        }
        out.error = columnText(stmt, 3);
        return true;
    }

    size_t CountJobs() {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "SELECT COUNT(*) FROM jobs;");
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw StoreError(std::string("CountJobs failed: ") + sqlite3_errmsg(m_db));
        }
        return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

    const std::string& path() const { return m_dbFilePath; }

  private:
    // Finalizes its statement on scope exit.
    class Statement {
      public:
        Statement(sqlite3* db, const char* sql) : m_stmt(nullptr) {
            if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK || !m_stmt) {
                throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
            }
        }
        ~Statement() { sqlite3_finalize(m_stmt); }
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;
        sqlite3_stmt* get() const { return m_stmt; }

      private:
        sqlite3_stmt* m_stmt;
    };

    void initDatabaseSchema() {
        const char* ddl = "CREATE TABLE IF NOT EXISTS jobs ("
                          " id TEXT PRIMARY KEY,"
                          " status TEXT NOT NULL,"
                          " result BLOB,"
                          " raw_size INTEGER,"
                          " error TEXT,"
                          " created_at DATETIME DEFAULT CURRENT_TIMESTAMP,"
                          " updated_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                          ");";
        char* errMsg = nullptr;
        int rc = sqlite3_exec(m_db, ddl, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string msg = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw StoreError("initDatabaseSchema: " + msg);
        }
    }

    void bindText(Statement& stmt, int index, const std::string& value) {
        if (sqlite3_bind_text(stmt.get(), index, value.c_str(), static_cast<int>(value.size()),
                              SQLITE_TRANSIENT) != SQLITE_OK) {
            throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(m_db));
        }
    }

    void stepDone(Statement& stmt, const char* what) {
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(m_db));
        }
    }

    void requireChanged(const std::string& jobId) {
        if (sqlite3_changes(m_db) == 0) {
            throw StoreError("unknown job " + jobId);
        }
    }

    static std::string columnText(Statement& stmt, int col) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    static std::vector<uint8_t> compress(const std::string& raw) {
        uLongf outSize = compressBound(static_cast<uLong>(raw.size()));
        std::vector<uint8_t> out(outSize);
        if (compress2(out.data(), &outSize, reinterpret_cast<const Bytef*>(raw.data()),
                      static_cast<uLong>(raw.size()), Z_BEST_COMPRESSION) != Z_OK) {
            throw StoreError("zlib compress2 failed");
        }
        out.resize(outSize);
        return out;
    }

    static std::string decompress(const uint8_t* data, size_t size, size_t rawSize) {
        std::string out(rawSize, '\0');
        uLongf outSize = static_cast<uLongf>(rawSize);
        if (rawSize == 0) {
            return out;
        }
        int rc = uncompress(reinterpret_cast<Bytef*>(&out[0]), &outSize, data, static_cast<uLong>(size));
        if (rc != Z_OK || outSize != rawSize) {
            throw StoreError("zlib uncompress failed (" + std::to_string(rc) + ")");
        }
        return out;
    }

    std::string m_dbFilePath;
    sqlite3* m_db;
    std::mutex m_mutex;
};

} // namespace store
} // namespace piiredactor

#endif // PIIREDACTOR_RESULT_STORE_HPP
