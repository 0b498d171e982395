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
 * ============================================================================
 * PhishGuard - FEATURE EXTRACTOR
 * ============================================================================
 *
 * @file FeatureExtractor.hpp
 * @brief Deterministic URL -> fixed-order numeric feature vector.
 *
 * The vector layout is a versioned contract shared with the training
 * pipeline. FEATURE_NAMES is the only definition of that order; model
 * metadata is validated against it at engine startup.
 *
 * FEATURES (index: name):
 *   0 domain_length       7 qty_slash_path
 *   1 qty_dot_domain      8 qty_dot_path
 *   2 qty_hyphen_domain   9 qty_hyphen_path
 *   3 qty_digit_domain   10 qty_digit_path
 *   4 domain_entropy     11 sus_keywords_count
 *   5 is_ip              12 tld_in_path
 *   6 path_length        13 qty_double_slash
 *
 * Entropy follows contract "byte256-v1": the 256 byte values are scanned
 * in ascending order and the sum is rounded to 4 decimals.
 * ============================================================================
 */

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../Core/ErrorCodes.hpp"

namespace PhishGuard {
namespace Features {

// ============================================================================
// CONSTANTS
// ============================================================================

inline constexpr size_t FEATURE_COUNT = 14;

/// @brief Feature order; must match the model metadata exactly
inline constexpr std::array<std::string_view, FEATURE_COUNT> FEATURE_NAMES = {
    "domain_length",
    "qty_dot_domain",
    "qty_hyphen_domain",
    "qty_digit_domain",
    "domain_entropy",
    "is_ip",
    "path_length",
    "qty_slash_path",
    "qty_dot_path",
    "qty_hyphen_path",
    "qty_digit_path",
    "sus_keywords_count",
    "tld_in_path",
    "qty_double_slash"
};

/// @brief Keywords counted by sus_keywords_count (each at most once)
inline constexpr std::array<std::string_view, 12> SUSPICIOUS_KEYWORDS = {
    "login", "verify", "update", "account", "secure", "banking",
    "confirm", "signin", "password", "wallet", "crypto", "admin"
};

/// @brief Entropy convention identifier carried in model metadata
inline constexpr std::string_view ENTROPY_CONTRACT = "byte256-v1";

// ============================================================================
// TYPES
// ============================================================================

using FeatureMap = std::map<std::string, double>;
using FeatureVector = std::vector<double>;

// ============================================================================
// FEATURE EXTRACTOR
// ============================================================================

class FeatureExtractor final {
public:
    FeatureExtractor() = delete;

    /**
     * @brief Extract named features from a raw URL.
     * @return std::nullopt exactly when the URL cannot be parsed
     */
    [[nodiscard]] static std::optional<FeatureMap> Extract(std::string_view url, Core::Error* err = nullptr);

    /**
     * @brief Map named features onto FEATURE_NAMES order.
     *
     * A missing name is a contract violation: 0 is substituted and an
     * error is logged. @p missingCount receives the number of substitutions.
     */
    [[nodiscard]] static FeatureVector ToArray(const FeatureMap& features, size_t* missingCount = nullptr);

    /// @brief Extract + ToArray
    [[nodiscard]] static std::optional<FeatureVector> ExtractArray(std::string_view url, Core::Error* err = nullptr);

    /// @brief True when every FEATURE_NAMES entry is present and finite
    [[nodiscard]] static bool Validate(const FeatureMap& features, Core::Error* err = nullptr);

    /// @brief Shannon entropy in bits, byte256-v1 convention
    [[nodiscard]] static double CalculateEntropy(std::string_view str);

    /**
     * @brief Round to four decimals on the exact binary value, ties to even.
     *
     * Same results as the training pipeline's round(x, 4); 0.03125 gives
     * 0.0312, not 0.0313. Part of the byte256-v1 entropy convention.
     */
    [[nodiscard]] static double RoundTo4(double value);

    /// @brief Number of distinct SUSPICIOUS_KEYWORDS found in @p url (case-insensitive)
    [[nodiscard]] static int CountSuspiciousKeywords(std::string_view url);

    /// @brief Position of @p name in FEATURE_NAMES, or std::nullopt
    [[nodiscard]] static std::optional<size_t> IndexOf(std::string_view name) noexcept;
};

}  // namespace Features
}  // namespace PhishGuard
