#pragma once

#include "reefradar/Errors.h"
#include "reefradar/ReefTypes.h"

#include <sqlite3.h>

#include <cstddef>
#include <optional>
#include <string>

namespace reefradar {

// Stored status row of one analysis.
struct AnalysisRecord {
    std::string analysisId;
    std::string uploadId;
    AnalysisStatus status{AnalysisStatus::Failed};
    std::string errorCode;              // empty when complete
    std::string errorMessage;
    std::string label;                  // empty when failed
    double confidence{0.0};
    bool synthetic{false};
    bool placeholder{false};
    std::size_t windowCount{0};
    double durationSeconds{0.0};
    std::string completedAt;
};

/**
 * ReferenceStore: SQLite persistence for the reference corpus and analyses
 *
 * Reference embeddings are stored as float32 BLOBs with their dimension.
 * The corpus is returned in insertion order; that order breaks nearest-site
 * ties and selects the projected reference points.
 */
class ReferenceStore {
  public:
    explicit ReferenceStore(const std::string& path);
    ~ReferenceStore();

    ReferenceStore(const ReferenceStore&) = delete;
    ReferenceStore& operator=(const ReferenceStore&) = delete;

    void initialize();

    // Insert or replace by site_id (keeps the original insertion position).
    void upsert_reference_site(const ReferenceSite& site);
    bool remove_reference_site(const std::string& siteId);
    Corpus load_reference_sites() const;
    std::size_t count_reference_sites() const;

    // Upsert a complete analysis with its probabilities and similar sites.
    void save_analysis(const AnalysisResult& result);
    void save_failure(const std::string& analysisId,
                      const std::string& uploadId,
                      ErrorCode code,
                      const std::string& message);

    std::optional<AnalysisRecord> load_analysis(const std::string& analysisId) const;

  private:
    sqlite3* db_{nullptr};
};

}  // namespace reefradar
