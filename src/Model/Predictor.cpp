/*
 * PhishGuard - Offline Phishing URL Classification Engine
 * Copyright (C) 2026 PhishGuard Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "Predictor.hpp"

#include <utility>

namespace PhishGuard {
namespace Model {

std::string_view GetRiskLevelName(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::Safe:       return "SAFE";
        case RiskLevel::Suspicious: return "SUSPICIOUS";
        case RiskLevel::Phishing:   return "PHISHING";
        case RiskLevel::Unknown:
        default:                    return "UNKNOWN";
    }
}

Predictor::Predictor(std::shared_ptr<const TreeEnsembleModel> model, ModelMetadata metadata,
                     double suspiciousMargin)
    : m_model(std::move(model))
    , m_metadata(std::move(metadata))
    , m_suspiciousMargin(suspiciousMargin) {
}

std::optional<double> Predictor::Predict(const std::vector<double>& features, Core::Error* err) const {
    if (!m_model) {
        Core::SetError(err, Core::ErrorKind::NotInitialized, "No model loaded");
        return std::nullopt;
    }
    return m_model->Predict(features, err);
}

std::optional<PredictionResult> Predictor::PredictWithConfidence(const std::vector<double>& features,
                                                                 Core::Error* err) const {
    const auto probability = Predict(features, err);
    if (!probability) {
        return std::nullopt;
    }

    PredictionResult result;
    result.probability = *probability;
    result.threshold = m_metadata.recommendedThreshold;
    result.level = ClassifyProbability(*probability);
    result.confidence = (result.level == RiskLevel::Safe) ? 1.0 - *probability : *probability;
    return result;
}

std::optional<std::vector<double>> Predictor::PredictBatch(const std::vector<std::vector<double>>& batch,
                                                           Core::Error* err) const {
    std::vector<double> out;
    out.reserve(batch.size());
    for (const auto& features : batch) {
        const auto p = Predict(features, err);
        if (!p) {
            return std::nullopt;
        }
        out.push_back(*p);
    }
    return out;
}

RiskLevel Predictor::ClassifyProbability(double probability) const noexcept {
    const double threshold = m_metadata.recommendedThreshold;
    if (probability >= threshold) return RiskLevel::Phishing;
    if (probability >= threshold - m_suspiciousMargin) return RiskLevel::Suspicious;
    return RiskLevel::Safe;
}

nlohmann::json Predictor::GetInfo() const {
    nlohmann::json info{
        { "loaded", m_model != nullptr },
        { "version", m_metadata.version },
        { "numFeatures", m_metadata.featureNames.size() },
        { "threshold", m_metadata.recommendedThreshold }
    };
    if (m_model) {
        info["numTrees"] = m_model->GetNumTrees();
        info["baseScore"] = m_model->GetBaseScore();
        info["anomalies"] = m_model->GetAnomalyCount();
    }
    return info;
}

}  // namespace Model
}  // namespace PhishGuard
