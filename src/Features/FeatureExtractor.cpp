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
#include "FeatureExtractor.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "../URL/URLParser.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace PhishGuard {
namespace Features {

using Utils::StringUtils::CountChar;
using Utils::StringUtils::CountDigits;
using Utils::StringUtils::CountSubstring;
using Utils::StringUtils::ToLowerAscii;

std::optional<FeatureMap> FeatureExtractor::Extract(std::string_view url, Core::Error* err) {
    const auto parsed = URL::URLParser::Parse(url, err);
    if (!parsed) {
        PG_LOG_DEBUG("Features", "URL could not be parsed, no features extracted");
        return std::nullopt;
    }

    const std::string& domain = parsed->hostname;
    const std::string& path = parsed->path;
    const std::string lowerPath = ToLowerAscii(path);

    FeatureMap features;

    // Domain
    features["domain_length"] = static_cast<double>(domain.size());
    features["qty_dot_domain"] = static_cast<double>(CountChar(domain, '.'));
    features["qty_hyphen_domain"] = static_cast<double>(CountChar(domain, '-'));
    features["qty_digit_domain"] = static_cast<double>(CountDigits(domain));
    features["domain_entropy"] = CalculateEntropy(domain);
    features["is_ip"] = URL::URLParser::IsIPv4(domain) ? 1.0 : 0.0;

    // Path
    features["path_length"] = static_cast<double>(path.size());
    features["qty_slash_path"] = static_cast<double>(CountChar(path, '/'));
    features["qty_dot_path"] = static_cast<double>(CountChar(path, '.'));
    features["qty_hyphen_path"] = static_cast<double>(CountChar(path, '-'));
    features["qty_digit_path"] = static_cast<double>(CountDigits(path));

    // Whole URL
    features["sus_keywords_count"] = static_cast<double>(CountSuspiciousKeywords(url));
    const bool tldInPath = lowerPath.find("com") != std::string::npos ||
                           lowerPath.find("net") != std::string::npos ||
                           lowerPath.find("org") != std::string::npos;
    features["tld_in_path"] = tldInPath ? 1.0 : 0.0;
    features["qty_double_slash"] = static_cast<double>(CountSubstring(path, "//"));

    return features;
}

FeatureVector FeatureExtractor::ToArray(const FeatureMap& features, size_t* missingCount) {
    FeatureVector out;
    out.reserve(FEATURE_COUNT);
    size_t missing = 0;

    for (const auto name : FEATURE_NAMES) {
        const auto it = features.find(std::string(name));
        if (it == features.end()) {
            PG_LOG_ERROR("Features", "Missing feature '%.*s', substituting 0",
                static_cast<int>(name.size()), name.data());
            ++missing;
            out.push_back(0.0);
        } else {
            out.push_back(it->second);
        }
    }

    if (missingCount) {
        *missingCount = missing;
    }
    return out;
}

std::optional<FeatureVector> FeatureExtractor::ExtractArray(std::string_view url, Core::Error* err) {
    const auto features = Extract(url, err);
    if (!features) {
        return std::nullopt;
    }
    return ToArray(*features);
}

bool FeatureExtractor::Validate(const FeatureMap& features, Core::Error* err) {
    for (const auto name : FEATURE_NAMES) {
        const auto it = features.find(std::string(name));
        if (it == features.end()) {
            Core::SetError(err, Core::ErrorKind::InvalidInput, "Missing feature: " + std::string(name));
            return false;
        }
        if (!std::isfinite(it->second)) {
            Core::SetError(err, Core::ErrorKind::InvalidInput, "Non-finite feature: " + std::string(name));
            return false;
        }
    }
    return true;
}

double FeatureExtractor::CalculateEntropy(std::string_view str) {
    if (str.empty()) return 0.0;

    std::array<size_t, 256> freqs{};
    for (char c : str) {
        ++freqs[static_cast<unsigned char>(c)];
    }

    const double len = static_cast<double>(str.size());
    double entropy = 0.0;
    for (size_t b = 0; b < freqs.size(); ++b) {
        if (freqs[b] == 0) continue;
        const double p = static_cast<double>(freqs[b]) / len;
        entropy -= p * std::log2(p);
    }

    return RoundTo4(entropy);
}

double FeatureExtractor::RoundTo4(double value) {
    if (!std::isfinite(value)) return value;
    // printf rounds the exact binary value to nearest, ties to even
    char buf[64];
    const int n = std::snprintf(buf, sizeof(buf), "%.4f", value);
    if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
        return std::nearbyint(value * 10000.0) / 10000.0;
    }
    return std::strtod(buf, nullptr);
}

int FeatureExtractor::CountSuspiciousKeywords(std::string_view url) {
    const std::string lower = ToLowerAscii(url);
    int count = 0;
    for (const auto keyword : SUSPICIOUS_KEYWORDS) {
        if (lower.find(keyword) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

std::optional<size_t> FeatureExtractor::IndexOf(std::string_view name) noexcept {
    for (size_t i = 0; i < FEATURE_NAMES.size(); ++i) {
        if (FEATURE_NAMES[i] == name) return i;
    }
    return std::nullopt;
}

}  // namespace Features
}  // namespace PhishGuard
