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
#pragma once
/**
 * @file Decision.hpp
 * @brief Verdict types returned by the decision engine.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../Features/FeatureExtractor.hpp"
#include "../Model/Predictor.hpp"

namespace PhishGuard {
namespace Decision {

enum class Action : uint8_t {
    Allow = 0,
    Warn,
    Block
};

/// @brief "ALLOW", "WARN", "BLOCK"
[[nodiscard]] std::string_view GetActionName(Action action) noexcept;

namespace Reasons {
    inline constexpr const char* WHITELISTED = "whitelisted";
    inline constexpr const char* POPULAR_DOMAIN = "popular_domain_check";
    inline constexpr const char* ML_PREDICTION = "ml_prediction";
    inline constexpr const char* FAILED = "error";
}  // namespace Reasons

/**
 * @brief Verdict for one URL. Immutable once returned; the cache stores it verbatim.
 */
struct Decision {
    std::string url;
    Action action = Action::Allow;
    Model::RiskLevel level = Model::RiskLevel::Unknown;
    std::optional<double> probability;          ///< Absent on the error path
    double confidence = 0.0;
    std::string reason;
    std::optional<Features::FeatureMap> features;
    bool cached = false;
    std::chrono::system_clock::time_point timestamp{};
    uint64_t latencyUs = 0;
    std::string error;                          ///< Empty unless reason == "error"

    [[nodiscard]] bool IsError() const noexcept { return !error.empty(); }

    [[nodiscard]] nlohmann::json ToJson() const;

    /// @brief Single-line JSON; bytes that are not UTF-8 become U+FFFD
    [[nodiscard]] std::string ToJsonLine() const;
};

}  // namespace Decision
}  // namespace PhishGuard
