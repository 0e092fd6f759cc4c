#include "assessment/assessment_store.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace panelsense {
namespace assessment {

AssessmentStore::Lease::Lease(AssessmentStore* store, Key key)
    : store_(store), key_(std::move(key)) {
}

AssessmentStore::Lease::Lease(Lease&& other) noexcept
    : store_(other.store_), key_(std::move(other.key_)) {
    other.store_ = nullptr;
}

AssessmentStore::Lease& AssessmentStore::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        store_ = other.store_;
        key_ = std::move(other.key_);
        other.store_ = nullptr;
    }
    return *this;
}

AssessmentStore::Lease::~Lease() {
    release();
}

void AssessmentStore::Lease::release() {
    if (store_) {
        store_->release(key_);
        store_ = nullptr;
    }
}

void AssessmentStore::setIndicators(const std::string& sessionId, std::vector<Indicator> indicators) {
    validateIndicators(indicators);

    std::lock_guard<std::mutex> lock(mutex_);
    utils::Logger::info("Session " + sessionId + ": " + std::to_string(indicators.size()) + " indicator(s) attached");
    indicators_[sessionId] = std::move(indicators);
}

std::vector<Indicator> AssessmentStore::indicators(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indicators_.find(sessionId);
    return it != indicators_.end() ? it->second : std::vector<Indicator>();
}

bool AssessmentStore::hasIndicators(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indicators_.find(sessionId);
    return it != indicators_.end() && !it->second.empty();
}

void AssessmentStore::recordArtifact(const std::string& sessionId, const std::string& artifactRef) {
    std::lock_guard<std::mutex> lock(mutex_);
    artifacts_[sessionId] = artifactRef;
}

std::optional<std::string> AssessmentStore::artifact(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = artifacts_.find(sessionId);
    if (it == artifacts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

AssessmentStore::Lease AssessmentStore::acquire(const std::string& sessionId, const std::string& indicatorId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key(sessionId, indicatorId);
    if (!leased_.insert(key).second) {
        throw utils::AssessmentInProgressException(sessionId, indicatorId);
    }
    return Lease(this, std::move(key));
}

bool AssessmentStore::isLeased(const std::string& sessionId, const std::string& indicatorId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_.count(Key(sessionId, indicatorId)) > 0;
}

void AssessmentStore::release(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    leased_.erase(key);
}

Assessment AssessmentStore::upsertAiResult(const std::string& sessionId, const std::string& indicatorId,
                                           double aiScore, std::vector<EvidenceSpan> evidence,
                                           std::string evidenceText, std::string reasoning) {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key(sessionId, indicatorId);

    Assessment& row = assessments_[key];
    row.sessionId = sessionId;
    row.indicatorId = indicatorId;
    row.aiScore = std::clamp(aiScore, 0.0, 100.0);
    row.evidence = std::move(evidence);
    row.evidenceText = std::move(evidenceText);
    row.reasoning = std::move(reasoning);
    row.updatedAt = std::chrono::system_clock::now();

    Assessment result = row;
    auto manual = manualScores_.find(key);
    if (manual != manualScores_.end()) {
        result.manualScore = manual->second;
    }
    return result;
}

bool AssessmentStore::clearAiResult(const std::string& sessionId, const std::string& indicatorId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return assessments_.erase(Key(sessionId, indicatorId)) > 0;
}

void AssessmentStore::setManualScore(const std::string& sessionId, const std::string& indicatorId,
                                     std::optional<double> score) {
    if (score && (!std::isfinite(*score) || *score < 0.0 || *score > 100.0)) {
        throw utils::ConfigurationException("Manual score must be within [0, 100]",
                                            sessionId + "/" + indicatorId);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indicators_.find(sessionId);
    if (it == indicators_.end()) {
        throw utils::NotFoundException("session", sessionId);
    }
    bool known = std::any_of(it->second.begin(), it->second.end(),
                             [&](const Indicator& indicator) { return indicator.id == indicatorId; });
    if (!known) {
        throw utils::NotFoundException("indicator", indicatorId);
    }

    Key key(sessionId, indicatorId);
    if (score) {
        manualScores_[key] = *score;
    } else {
        manualScores_.erase(key);
    }
}

std::optional<double> AssessmentStore::manualScore(const std::string& sessionId,
                                                   const std::string& indicatorId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = manualScores_.find(Key(sessionId, indicatorId));
    if (it == manualScores_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Assessment> AssessmentStore::find(const std::string& sessionId, const std::string& indicatorId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key(sessionId, indicatorId);
    auto it = assessments_.find(key);
    if (it == assessments_.end()) {
        return std::nullopt;
    }

    Assessment result = it->second;
    auto manual = manualScores_.find(key);
    if (manual != manualScores_.end()) {
        result.manualScore = manual->second;
    }
    return result;
}

std::vector<Assessment> AssessmentStore::forSession(const std::string& sessionId) const {
    std::vector<Assessment> result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = assessments_.lower_bound(Key(sessionId, "")); it != assessments_.end(); ++it) {
        if (it->first.first != sessionId) {
            break;
        }
        Assessment row = it->second;
        auto manual = manualScores_.find(it->first);
        if (manual != manualScores_.end()) {
            row.manualScore = manual->second;
        }
        result.push_back(std::move(row));
    }
    return result;
}

size_t AssessmentStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assessments_.size();
}

namespace {

template<typename Map>
void eraseSessionKeys(Map& rows, const std::string& sessionId) {
    auto first = rows.lower_bound(AssessmentStore::Key(sessionId, ""));
    auto last = first;
    while (last != rows.end() && last->first.first == sessionId) {
        ++last;
    }
    rows.erase(first, last);
}

} // namespace

bool AssessmentStore::forgetSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto leased = leased_.lower_bound(Key(sessionId, ""));
    if (leased != leased_.end() && leased->first == sessionId) {
        utils::Logger::debug("Session " + sessionId + " is being assessed, keeping its results");
        return false;
    }

    indicators_.erase(sessionId);
    artifacts_.erase(sessionId);
    eraseSessionKeys(assessments_, sessionId);
    eraseSessionKeys(manualScores_, sessionId);
    return true;
}

bool AssessmentStore::knowsSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (indicators_.count(sessionId) > 0 || artifacts_.count(sessionId) > 0) {
        return true;
    }
    auto row = assessments_.lower_bound(Key(sessionId, ""));
    return row != assessments_.end() && row->first.first == sessionId;
}

} // namespace assessment
} // namespace panelsense
