#include "reefradar/ReferenceStore.h"

#include <memory>
#include <string>
#include <vector>

#include "reefradar/CoreContract.h"
#include "reefradar/Log.h"
#include "reefradar/Utility.h"

namespace reefradar {

namespace {

constexpr const char* kTag = "store";

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

[[noreturn]] void throw_storage(const std::string& message) {
    throw ReefError(ErrorCode::StorageFailure, message);
}

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw_storage(message);
    }
}

Statement prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw_storage(sqlite3_errmsg(db));
    }
    return Statement(stmt);
}

void step_done_or_throw(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw_storage(sqlite3_errmsg(db));
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

const char* status_to_string(AnalysisStatus status) {
    return status == AnalysisStatus::Complete ? "complete" : "failed";
}

// Runs body inside BEGIN/COMMIT, rolling back and rethrowing on failure.
template <typename Body>
void in_transaction(sqlite3* db, Body&& body) {
    exec_or_throw(db, "BEGIN TRANSACTION;");
    try {
        body();
        exec_or_throw(db, "COMMIT;");
    } catch (...) {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

void delete_analysis_children(sqlite3* db, sqlite3_int64 rowId) {
    for (const char* table : {"analysis_probabilities", "analysis_similar_sites"}) {
        auto del = prepare_or_throw(db, std::string("DELETE FROM ") + table + " WHERE analysis_row_id=?;");
        sqlite3_bind_int64(del.get(), 1, rowId);
        step_done_or_throw(db, del.get());
    }
}

}  // namespace

ReferenceStore::ReferenceStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = "Failed to open SQLite database at " + path;
        if (db_) {
            message += ": ";
            message += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw_storage(message);
    }
}

ReferenceStore::~ReferenceStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void ReferenceStore::initialize() {
    const char* schema = R"SQL(
        PRAGMA journal_mode=WAL;
        PRAGMA foreign_keys=ON;

        CREATE TABLE IF NOT EXISTS schema_version (
            version TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS reference_sites (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            site_id TEXT NOT NULL UNIQUE,
            country TEXT NOT NULL,
            site_type TEXT NOT NULL,           -- H / D / R / M
            dimension INTEGER NOT NULL,
            embedding_blob BLOB NOT NULL,      -- float32[dimension]
            created_at TEXT DEFAULT CURRENT_TIMESTAMP,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP
        );

        CREATE INDEX IF NOT EXISTS idx_reference_sites_type ON reference_sites(site_type);

        CREATE TABLE IF NOT EXISTS analyses (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            analysis_id TEXT NOT NULL UNIQUE,
            upload_id TEXT,
            status TEXT NOT NULL,              -- "complete" / "failed"
            error_code TEXT,
            error_message TEXT,
            label TEXT,
            confidence REAL,
            synthetic INTEGER NOT NULL DEFAULT 0,
            placeholder INTEGER NOT NULL DEFAULT 0,
            window_count INTEGER NOT NULL DEFAULT 0,
            duration_sec REAL,
            original_sample_rate INTEGER,
            caveats TEXT,
            completed_at TEXT,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP
        );

        CREATE INDEX IF NOT EXISTS idx_analyses_upload ON analyses(upload_id);

        CREATE TABLE IF NOT EXISTS analysis_probabilities (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            analysis_row_id INTEGER NOT NULL,
            category TEXT NOT NULL,
            probability REAL NOT NULL,
            FOREIGN KEY(analysis_row_id) REFERENCES analyses(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_probabilities_analysis ON analysis_probabilities(analysis_row_id);

        CREATE TABLE IF NOT EXISTS analysis_similar_sites (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            analysis_row_id INTEGER NOT NULL,
            rank INTEGER NOT NULL,
            site_id TEXT NOT NULL,
            country TEXT,
            category TEXT,
            similarity REAL NOT NULL,
            FOREIGN KEY(analysis_row_id) REFERENCES analyses(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_similar_sites_analysis ON analysis_similar_sites(analysis_row_id);
    )SQL";

    exec_or_throw(db_, schema);

    auto count = prepare_or_throw(db_, "SELECT COUNT(*) FROM schema_version;");
    if (sqlite3_step(count.get()) == SQLITE_ROW && sqlite3_column_int(count.get(), 0) == 0) {
        auto insert = prepare_or_throw(db_, "INSERT INTO schema_version (version) VALUES (?);");
        sqlite3_bind_text(insert.get(), 1, contract::CORE_CONTRACT_VERSION, -1, SQLITE_TRANSIENT);
        step_done_or_throw(db_, insert.get());
    }
}

void ReferenceStore::upsert_reference_site(const ReferenceSite& site) {
    if (site.siteId.empty()) {
        throw_storage("Reference site requires a site_id");
    }

    // Serialize embedding to BLOB (float array)
    std::vector<float> floatValues(site.meanEmbedding.begin(), site.meanEmbedding.end());
    const std::string code(1, category_to_site_code(site.category));

    auto stmt = prepare_or_throw(db_,
        "INSERT INTO reference_sites (site_id, country, site_type, dimension, embedding_blob, updated_at) "
        "VALUES (?,?,?,?,?, CURRENT_TIMESTAMP) "
        "ON CONFLICT(site_id) DO UPDATE SET "
        "country=excluded.country, site_type=excluded.site_type, dimension=excluded.dimension, "
        "embedding_blob=excluded.embedding_blob, updated_at=CURRENT_TIMESTAMP;");

    sqlite3_bind_text(stmt.get(), 1, site.siteId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, site.country.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, code.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 4, static_cast<int>(floatValues.size()));
    sqlite3_bind_blob(stmt.get(), 5, floatValues.data(), static_cast<int>(floatValues.size() * sizeof(float)),
                      SQLITE_TRANSIENT);
    step_done_or_throw(db_, stmt.get());

    REEFRADAR_LOG_DEBUG(kTag, "stored reference site ", site.siteId, " (", floatValues.size(), " dims)");
}

bool ReferenceStore::remove_reference_site(const std::string& siteId) {
    auto stmt = prepare_or_throw(db_, "DELETE FROM reference_sites WHERE site_id=?;");
    sqlite3_bind_text(stmt.get(), 1, siteId.c_str(), -1, SQLITE_TRANSIENT);
    step_done_or_throw(db_, stmt.get());
    return sqlite3_changes(db_) > 0;
}

Corpus ReferenceStore::load_reference_sites() const {
    auto stmt = prepare_or_throw(db_,
        "SELECT site_id, country, site_type, dimension, embedding_blob FROM reference_sites ORDER BY id;");

    Corpus corpus;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ReferenceSite site;
        site.siteId = column_text(stmt.get(), 0);
        site.country = column_text(stmt.get(), 1);
        const std::string code = column_text(stmt.get(), 2);
        site.category = category_from_site_code(code.empty() ? '?' : code.front());

        const int dimension = sqlite3_column_int(stmt.get(), 3);
        const void* blob = sqlite3_column_blob(stmt.get(), 4);
        const int bytes = sqlite3_column_bytes(stmt.get(), 4);
        if (dimension < 0 || static_cast<std::size_t>(bytes) != static_cast<std::size_t>(dimension) * sizeof(float)) {
            throw_storage("Corrupt embedding for reference site " + site.siteId);
        }
        const float* values = static_cast<const float*>(blob);
        site.meanEmbedding.assign(values, values + dimension);
        corpus.push_back(std::move(site));
    }
    if (rc != SQLITE_DONE) {
        throw_storage(sqlite3_errmsg(db_));
    }
    return corpus;
}

std::size_t ReferenceStore::count_reference_sites() const {
    auto stmt = prepare_or_throw(db_, "SELECT COUNT(*) FROM reference_sites;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw_storage(sqlite3_errmsg(db_));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

void ReferenceStore::save_analysis(const AnalysisResult& result) {
    in_transaction(db_, [&]() {
        // Insert analysis record with proper UPSERT on analysis_id
        sqlite3_int64 rowId = -1;
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO analyses (analysis_id, upload_id, status, error_code, error_message, label, confidence, "
                "synthetic, placeholder, window_count, duration_sec, original_sample_rate, caveats, completed_at, "
                "updated_at) "
                "VALUES (?,?,?,NULL,NULL,?,?,?,?,?,?,?,?,?, CURRENT_TIMESTAMP) "
                "ON CONFLICT(analysis_id) DO UPDATE SET "
                "upload_id=excluded.upload_id, status=excluded.status, error_code=NULL, error_message=NULL, "
                "label=excluded.label, confidence=excluded.confidence, synthetic=excluded.synthetic, "
                "placeholder=excluded.placeholder, window_count=excluded.window_count, "
                "duration_sec=excluded.duration_sec, original_sample_rate=excluded.original_sample_rate, "
                "caveats=excluded.caveats, completed_at=excluded.completed_at, updated_at=CURRENT_TIMESTAMP "
                "RETURNING id;");

            const std::string label = category_to_string(result.classification.label);
            sqlite3_bind_text(stmt.get(), 1, result.analysisId.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, result.uploadId.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 3, status_to_string(AnalysisStatus::Complete), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 4, label.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt.get(), 5, result.classification.confidence);
            sqlite3_bind_int(stmt.get(), 6, result.embedding.synthetic ? 1 : 0);
            sqlite3_bind_int(stmt.get(), 7, result.classification.placeholder ? 1 : 0);
            sqlite3_bind_int64(stmt.get(), 8, static_cast<sqlite3_int64>(result.windowCount));
            sqlite3_bind_double(stmt.get(), 9, result.processedDurationSeconds);
            sqlite3_bind_int(stmt.get(), 10, result.originalSampleRate);
            sqlite3_bind_text(stmt.get(), 11, result.caveats.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 12, result.completedAt.c_str(), -1, SQLITE_TRANSIENT);

            if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
                rowId = sqlite3_column_int64(stmt.get(), 0);
            }
        }

        if (rowId < 0) {
            throw_storage("Failed to insert/get analysis row for " + result.analysisId);
        }

        // Replace child rows
        delete_analysis_children(db_, rowId);

        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO analysis_probabilities (analysis_row_id, category, probability) VALUES (?,?,?);");
            for (const auto& p : result.classification.probabilities) {
                const std::string category = category_to_string(p.category);
                sqlite3_bind_int64(stmt.get(), 1, rowId);
                sqlite3_bind_text(stmt.get(), 2, category.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt.get(), 3, p.probability);
                step_done_or_throw(db_, stmt.get());
                sqlite3_reset(stmt.get());
            }
        }

        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO analysis_similar_sites (analysis_row_id, rank, site_id, country, category, similarity) "
                "VALUES (?,?,?,?,?,?);");
            int rank = 0;
            for (const auto& site : result.similarSites) {
                const std::string category = category_to_string(site.category);
                sqlite3_bind_int64(stmt.get(), 1, rowId);
                sqlite3_bind_int(stmt.get(), 2, rank++);
                sqlite3_bind_text(stmt.get(), 3, site.siteId.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt.get(), 4, site.country.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt.get(), 5, category.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt.get(), 6, site.similarity);
                step_done_or_throw(db_, stmt.get());
                sqlite3_reset(stmt.get());
            }
        }
    });
}

void ReferenceStore::save_failure(const std::string& analysisId,
                                  const std::string& uploadId,
                                  ErrorCode code,
                                  const std::string& message) {
    const std::string codeString = error_code_to_string(code);
    const std::string now = utc_timestamp_now();
    in_transaction(db_, [&]() {
        // A failure replaces any earlier result for the same analysis id
        sqlite3_int64 rowId = -1;
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO analyses (analysis_id, upload_id, status, error_code, error_message, completed_at, "
                "updated_at) "
                "VALUES (?,?,?,?,?,?, CURRENT_TIMESTAMP) "
                "ON CONFLICT(analysis_id) DO UPDATE SET "
                "upload_id=excluded.upload_id, status=excluded.status, error_code=excluded.error_code, "
                "error_message=excluded.error_message, label=NULL, confidence=NULL, synthetic=0, placeholder=0, "
                "window_count=0, duration_sec=NULL, original_sample_rate=NULL, caveats=NULL, "
                "completed_at=excluded.completed_at, updated_at=CURRENT_TIMESTAMP "
                "RETURNING id;");

            sqlite3_bind_text(stmt.get(), 1, analysisId.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, uploadId.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 3, status_to_string(AnalysisStatus::Failed), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 4, codeString.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 5, message.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 6, now.c_str(), -1, SQLITE_TRANSIENT);

            if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
                rowId = sqlite3_column_int64(stmt.get(), 0);
            }
        }

        if (rowId < 0) {
            throw_storage("Failed to insert/get analysis row for " + analysisId);
        }

        delete_analysis_children(db_, rowId);
    });
}

std::optional<AnalysisRecord> ReferenceStore::load_analysis(const std::string& analysisId) const {
    auto stmt = prepare_or_throw(db_,
        "SELECT analysis_id, upload_id, status, error_code, error_message, label, confidence, synthetic, "
        "placeholder, window_count, duration_sec, completed_at FROM analyses WHERE analysis_id=?;");
    sqlite3_bind_text(stmt.get(), 1, analysisId.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw_storage(sqlite3_errmsg(db_));

    AnalysisRecord record;
    record.analysisId = column_text(stmt.get(), 0);
    record.uploadId = column_text(stmt.get(), 1);
    record.status = column_text(stmt.get(), 2) == "complete" ? AnalysisStatus::Complete : AnalysisStatus::Failed;
    record.errorCode = column_text(stmt.get(), 3);
    record.errorMessage = column_text(stmt.get(), 4);
    record.label = column_text(stmt.get(), 5);
    record.confidence = sqlite3_column_double(stmt.get(), 6);
    record.synthetic = sqlite3_column_int(stmt.get(), 7) != 0;
    record.placeholder = sqlite3_column_int(stmt.get(), 8) != 0;
    record.windowCount = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 9));
    record.durationSeconds = sqlite3_column_double(stmt.get(), 10);
    record.completedAt = column_text(stmt.get(), 11);
    return record;
}

}  // namespace reefradar
