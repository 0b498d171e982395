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
#include "Decision.hpp"

#include "../Utils/JSONUtils.hpp"

namespace PhishGuard {
namespace Decision {

std::string_view GetActionName(Action action) noexcept {
    switch (action) {
        case Action::Block: return "BLOCK";
        case Action::Warn:  return "WARN";
        case Action::Allow:
        default:            return "ALLOW";
    }
}

nlohmann::json Decision::ToJson() const {
    nlohmann::json j{
        { "url", url },
        { "action", std::string(GetActionName(action)) },
        { "level", std::string(Model::GetRiskLevelName(level)) },
        { "confidence", confidence },
        { "reason", reason },
        { "cached", cached },
        { "timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                           timestamp.time_since_epoch()).count() },
        { "latencyUs", latencyUs }
    };

    j["probability"] = probability ? nlohmann::json(*probability) : nlohmann::json(nullptr);
    if (features) {
        j["features"] = *features;
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

std::string Decision::ToJsonLine() const {
    std::string out;
    if (!Utils::JSON::Stringify(ToJson(), out)) {
        return "{}";
    }
    return out;
}

}  // namespace Decision
}  // namespace PhishGuard
