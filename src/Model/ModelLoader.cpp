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
#include "ModelLoader.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

#include "../Features/FeatureExtractor.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace PhishGuard {
namespace Model {

using Json = nlohmann::json;

namespace {

const std::vector<std::string> kTreeArrays = {
    "left_children", "right_children", "split_indices", "split_conditions", "base_weights"
};

// Children are stored as signed integers; -1 marks "no child". Unsigned
// values past int64 range are rejected instead of wrapping to negatives.
bool ReadChild(const Json& value, int64_t& out) {
    if (!value.is_number_integer()) return false;
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    out = value.get<int64_t>();
    return true;
}

// Range-checked against numFeatures before narrowing.
bool ReadFeatureIndex(const Json& value, size_t numFeatures, uint32_t& out) {
    if (value.is_number_unsigned()) {
        const uint64_t v = value.get<uint64_t>();
        if (v >= numFeatures) return false;
        out = static_cast<uint32_t>(v);
        return true;
    }
    if (value.is_number_integer()) {
        const int64_t v = value.get<int64_t>();
        if (v < 0 || static_cast<uint64_t>(v) >= numFeatures) return false;
        out = static_cast<uint32_t>(v);
        return true;
    }
    if (value.is_number_float()) {
        const double v = value.get<double>();
        if (!std::isfinite(v) || v < 0 || std::floor(v) != v || v >= static_cast<double>(numFeatures)) {
            return false;
        }
        out = static_cast<uint32_t>(v);
        return true;
    }
    return false;
}

std::optional<Tree> BuildTree(const Json& treeDoc, size_t treeIndex, size_t numFeatures, Core::Error* err) {
    const std::string where = "tree " + std::to_string(treeIndex);

    if (!treeDoc.is_object()) {
        Core::SetError(err, Core::ErrorKind::ModelFormatError, where + " is not an object");
        return std::nullopt;
    }
    Utils::JSON::Error keyErr;
    if (!Utils::JSON::RequireKeys(treeDoc, "", kTreeArrays, &keyErr)) {
        Core::SetError(err, Core::ErrorKind::ModelFormatError, where + ": " + keyErr.message);
        return std::nullopt;
    }
    for (const auto& key : kTreeArrays) {
        if (!treeDoc[key].is_array()) {
            Core::SetError(err, Core::ErrorKind::ModelFormatError, where + " field '" + key + "' is not an array");
            return std::nullopt;
        }
    }

    const Json& left = treeDoc["left_children"];
    const Json& right = treeDoc["right_children"];
    const Json& indices = treeDoc["split_indices"];
    const Json& conditions = treeDoc["split_conditions"];
    const Json& weights = treeDoc["base_weights"];

    const size_t n = left.size();
    if (n == 0) {
        Core::SetError(err, Core::ErrorKind::ModelFormatError, where + " is empty");
        return std::nullopt;
    }
    if (right.size() != n || indices.size() != n || conditions.size() != n || weights.size() != n) {
        Core::SetError(err, Core::ErrorKind::ModelFormatError, where + " has arrays of unequal length");
        return std::nullopt;
    }

    Tree tree;
    tree.nodes.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        const std::string node = where + " node " + std::to_string(i);

        int64_t l = 0;
        int64_t r = 0;
        if (!ReadChild(left[i], l) || !ReadChild(right[i], r)) {
            Core::SetError(err, Core::ErrorKind::ModelFormatError, node + " has a non-integer child index");
            return std::nullopt;
        }

        if (l == -1 && r == -1) {
            if (!weights[i].is_number()) {
                Core::SetError(err, Core::ErrorKind::ModelFormatError, node + " has a non-numeric leaf weight");
                return std::nullopt;
            }
            tree.nodes.emplace_back(LeafNode{ weights[i].get<double>() });
            continue;
        }

        if (l == -1 || r == -1) {
            Core::SetError(err, Core::ErrorKind::ModelFormatError, node + " has exactly one child");
            return std::nullopt;
        }
        if (l < 0 || r < 0 || static_cast<size_t>(l) >= n || static_cast<size_t>(r) >= n) {
            Core::SetError(err, Core::ErrorKind::ModelFormatError, node + " child index out of range");
            return std::nullopt;
        }

        uint32_t feature = 0;
        if (!ReadFeatureIndex(indices[i], numFeatures, feature)) {
            Core::SetError(err, Core::ErrorKind::ModelFormatError,
                node + " has a split index outside [0, " + std::to_string(numFeatures) + ")");
            return std::nullopt;
        }
        if (!conditions[i].is_number()) {
            Core::SetError(err, Core::ErrorKind::ModelFormatError, node + " has a non-numeric split condition");
            return std::nullopt;
        }

        SplitNode split;
        split.featureIndex = feature;
        split.threshold = conditions[i].get<double>();
        split.left = static_cast<uint32_t>(l);
        split.right = static_cast<uint32_t>(r);
        tree.nodes.emplace_back(split);
    }

    return tree;
}

// Split indices are stored as uint32_t, so the feature count is capped there.
std::optional<size_t> ParseNumFeature(const Json& value) {
    constexpr uint64_t kMaxFeatures = std::numeric_limits<uint32_t>::max();
    if (value.is_number_unsigned()) {
        const uint64_t v = value.get<uint64_t>();
        if (v > 0 && v <= kMaxFeatures) return static_cast<size_t>(v);
        return std::nullopt;
    }
    if (value.is_number_integer()) {
        const int64_t v = value.get<int64_t>();
        if (v > 0 && static_cast<uint64_t>(v) <= kMaxFeatures) return static_cast<size_t>(v);
        return std::nullopt;
    }
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        uint64_t v = 0;
        for (char c : s) {
            if (!Utils::StringUtils::IsAsciiDigit(c)) return std::nullopt;
            v = v * 10 + static_cast<uint64_t>(c - '0');
            if (v > kMaxFeatures) return std::nullopt;
        }
        if (v > 0) return static_cast<size_t>(v);
    }
    return std::nullopt;
}

}  // namespace

// ============================================================================
// METADATA
// ============================================================================

Json ModelMetadata::ToJson() const {
    Json j{
        { "version", version },
        { "feature_names", featureNames },
        { "recommended_threshold", recommendedThreshold }
    };
    if (!entropy.empty()) {
        j["entropy"] = entropy;
    }
    return j;
}

// ============================================================================
// MODEL LOADING
// ============================================================================

std::optional<double> ModelLoader::ParseBaseScore(const Json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    std::string text(Utils::StringUtils::TrimAscii(value.get_ref<const std::string&>()));
    if (!text.empty() && text.front() == '[') text.erase(0, 1);
    if (!text.empty() && text.back() == ']') text.pop_back();
    text = std::string(Utils::StringUtils::TrimAscii(text));
    if (text.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::shared_ptr<const TreeEnsembleModel> ModelLoader::LoadModelFromJson(const Json& doc, Core::Error* err) {
    if (!doc.is_object()) {
        Core::SetError(err, Core::ErrorKind::ModelFormatError, "Model document is not an object");
        return nullptr;
    }

    // Locate the trees array and the parameter block in either layout
    const Json* treesDoc = nullptr;
    const Json* params = &doc;
    if (doc.contains("learner")) {
        const Json& learner = doc["learner"];
        constexpr const char* kTreesPointer = "/gradient_booster/model/trees";
        if (learner.is_object() && Utils::JSON::Contains(learner, kTreesPointer)) {
            treesDoc = &learner.at(Json::json_pointer(kTreesPointer));
        }
        if (learner.is_object() && learner.contains("learner_model_param")) {
            params = &learner["learner_model_param"];
        }
    } else if (doc.contains("trees")) {
        treesDoc = &doc["trees"];
    }

    if (treesDoc == nullptr || !treesDoc->is_array()) {
        Core::SetError(err, Core::ErrorKind::ModelFormatError, "Model document has no trees array");
        return nullptr;
    }

    double baseScore = DEFAULT_BASE_SCORE;
    if (params->is_object() && params->contains("base_score")) {
        const auto parsed = ParseBaseScore((*params)["base_score"]);
        if (!parsed) {
            Core::SetError(err, Core::ErrorKind::ModelFormatError, "Unparseable base_score");
            return nullptr;
        }
        baseScore = *parsed;
    } else {
        PG_LOG_WARN("Model", "base_score absent, using default %.2f", DEFAULT_BASE_SCORE);
    }

    size_t numFeatures = Features::FEATURE_COUNT;
    if (params->is_object() && params->contains("num_feature")) {
        const auto parsed = ParseNumFeature((*params)["num_feature"]);
        if (!parsed) {
            Core::SetError(err, Core::ErrorKind::ModelFormatError, "Invalid num_feature");
            return nullptr;
        }
        numFeatures = *parsed;
    } else {
        PG_LOG_WARN("Model", "num_feature absent, assuming %zu", numFeatures);
    }

    std::vector<Tree> trees;
    trees.reserve(treesDoc->size());
    try {
        for (size_t i = 0; i < treesDoc->size(); ++i) {
            auto tree = BuildTree((*treesDoc)[i], i, numFeatures, err);
            if (!tree) {
                return nullptr;
            }
            trees.push_back(std::move(*tree));
        }
    }
    catch (const nlohmann::json::exception& e) {
        Core::SetError(err, Core::ErrorKind::ModelFormatError, e.what());
        return nullptr;
    }

    PG_LOG_INFO("Model", "Loaded %zu trees, %zu features, base_score=%.6f",
        trees.size(), numFeatures, baseScore);

    return std::make_shared<TreeEnsembleModel>(std::move(trees), baseScore, numFeatures);
}

std::shared_ptr<const TreeEnsembleModel> ModelLoader::LoadModelFromFile(const std::filesystem::path& path,
                                                                       Core::Error* err) {
    Utils::JSON::Json doc;
    Utils::JSON::Error jsonErr;
    if (!Utils::JSON::LoadFromFile(path, doc, &jsonErr)) {
        PG_LOG_ERROR("Model", "Cannot load model %s: %s", path.string().c_str(), jsonErr.message.c_str());
        Core::SetError(err, Core::ErrorKind::ModelLoadError, path.string() + ": " + jsonErr.message);
        return nullptr;
    }
    return LoadModelFromJson(doc, err);
}

// ============================================================================
// METADATA LOADING
// ============================================================================

std::optional<ModelMetadata> ModelLoader::LoadMetadataFromJson(const Json& doc, Core::Error* err) {
    if (!doc.is_object()) {
        Core::SetError(err, Core::ErrorKind::ModelLoadError, "Metadata document is not an object");
        return std::nullopt;
    }

    ModelMetadata meta;

    const auto names = doc.find("feature_names");
    if (names == doc.end() || !names->is_array()) {
        Core::SetError(err, Core::ErrorKind::ModelLoadError, "Metadata missing feature_names");
        return std::nullopt;
    }
    for (const auto& name : *names) {
        if (!name.is_string()) {
            Core::SetError(err, Core::ErrorKind::ModelLoadError, "Metadata feature_names must be strings");
            return std::nullopt;
        }
        meta.featureNames.push_back(name.get<std::string>());
    }

    const auto threshold = doc.find("recommended_threshold");
    if (threshold == doc.end() || !threshold->is_number()) {
        Core::SetError(err, Core::ErrorKind::ModelLoadError, "Metadata missing recommended_threshold");
        return std::nullopt;
    }
    meta.recommendedThreshold = threshold->get<double>();
    if (!(meta.recommendedThreshold >= 0.0 && meta.recommendedThreshold <= 1.0)) {
        Core::SetError(err, Core::ErrorKind::ModelLoadError, "recommended_threshold outside [0, 1]");
        return std::nullopt;
    }

    const auto version = doc.find("version");
    if (version != doc.end()) {
        meta.version = version->is_string() ? version->get<std::string>() : version->dump();
    }

    const auto entropy = doc.find("entropy");
    if (entropy != doc.end() && entropy->is_string()) {
        meta.entropy = entropy->get<std::string>();
    }

    return meta;
}

std::optional<ModelMetadata> ModelLoader::LoadMetadataFromFile(const std::filesystem::path& path,
                                                              Core::Error* err) {
    Utils::JSON::Json doc;
    Utils::JSON::Error jsonErr;
    if (!Utils::JSON::LoadFromFile(path, doc, &jsonErr)) {
        PG_LOG_ERROR("Model", "Cannot load metadata %s: %s", path.string().c_str(), jsonErr.message.c_str());
        Core::SetError(err, Core::ErrorKind::ModelLoadError, path.string() + ": " + jsonErr.message);
        return std::nullopt;
    }
    return LoadMetadataFromJson(doc, err);
}

// ============================================================================
// CONTRACT
// ============================================================================

bool ModelLoader::ValidateFeatureContract(const TreeEnsembleModel& model,
                                          const ModelMetadata& metadata,
                                          Core::Error* err) {
    if (model.GetNumFeatures() != Features::FEATURE_COUNT) {
        Core::SetError(err, Core::ErrorKind::FeatureCountMismatch,
            "Model expects " + std::to_string(model.GetNumFeatures()) +
            " features, extractor produces " + std::to_string(Features::FEATURE_COUNT));
        return false;
    }
    if (metadata.featureNames.size() != Features::FEATURE_COUNT) {
        Core::SetError(err, Core::ErrorKind::FeatureCountMismatch,
            "Metadata lists " + std::to_string(metadata.featureNames.size()) +
            " features, extractor produces " + std::to_string(Features::FEATURE_COUNT));
        return false;
    }

    for (size_t i = 0; i < Features::FEATURE_COUNT; ++i) {
        if (metadata.featureNames[i] != Features::FEATURE_NAMES[i]) {
            Core::SetError(err, Core::ErrorKind::FeatureOrderMismatch,
                "Feature " + std::to_string(i) + " is '" + metadata.featureNames[i] +
                "', expected '" + std::string(Features::FEATURE_NAMES[i]) + "'");
            return false;
        }
    }

    if (!metadata.entropy.empty() && metadata.entropy != Features::ENTROPY_CONTRACT) {
        Core::SetError(err, Core::ErrorKind::FeatureOrderMismatch,
            "Entropy convention '" + metadata.entropy + "' is not " + std::string(Features::ENTROPY_CONTRACT));
        return false;
    }

    return true;
}

}  // namespace Model
}  // namespace PhishGuard
