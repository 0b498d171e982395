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
#include "ErrorCodes.hpp"

#include <utility>

namespace PhishGuard {
	namespace Core {

		std::string Error::ToString() const {
			if (!hasError()) return {};
			std::string out(GetErrorKindName(kind));
			if (!message.empty()) {
				out += ": ";
				out += message;
			}
			return out;
		}

		void SetError(Error* err, ErrorKind kind, std::string message) {
			if (!err) return;
			err->kind = kind;
			err->message = std::move(message);
		}

		std::string_view GetErrorKindName(ErrorKind kind) noexcept {
			switch (kind) {
			case ErrorKind::None:                 return "None";
			case ErrorKind::ParseError:           return "ParseError";
			case ErrorKind::ModelLoadError:       return "ModelLoadError";
			case ErrorKind::ModelFormatError:     return "ModelFormatError";
			case ErrorKind::FeatureCountMismatch: return "FeatureCountMismatch";
			case ErrorKind::FeatureOrderMismatch: return "FeatureOrderMismatch";
			case ErrorKind::UnknownProfile:       return "UnknownProfile";
			case ErrorKind::InvalidInput:         return "InvalidInput";
			case ErrorKind::NotInitialized:       return "NotInitialized";
			case ErrorKind::StorageError:         return "StorageError";
			case ErrorKind::Internal:             return "Internal";
			default:                              return "Unknown";
			}
		}

		bool IsFatal(ErrorKind kind) noexcept {
			return kind == ErrorKind::ModelLoadError ||
			       kind == ErrorKind::ModelFormatError ||
			       kind == ErrorKind::FeatureCountMismatch ||
			       kind == ErrorKind::FeatureOrderMismatch;
		}

	}  // namespace Core
}  // namespace PhishGuard
