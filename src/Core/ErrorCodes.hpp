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
 * @file ErrorCodes.hpp
 * @brief Error taxonomy shared by every PhishGuard pipeline stage.
 *
 * Stages report failure through a `bool` or `std::optional` return plus an
 * optional `Error*` out-parameter, never by throwing across module
 * boundaries. The Decision Engine aggregates per-URL errors into a
 * fail-open verdict; startup errors keep the engine out of the ready state.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace PhishGuard {
	namespace Core {

		/**
		 * @brief Classification of pipeline failures.
		 */
		enum class ErrorKind : uint8_t {
			None = 0,              ///< No error
			ParseError,            ///< Malformed URL (recoverable, fail-open)
			ModelLoadError,        ///< Model or metadata artifact unreadable (fatal)
			ModelFormatError,      ///< Model document structurally invalid (fatal)
			FeatureCountMismatch,  ///< Model/metadata feature count differs from extractor (fatal)
			FeatureOrderMismatch,  ///< Metadata feature order differs from extractor (fatal)
			UnknownProfile,        ///< Unrecognized threshold profile name
			InvalidInput,          ///< Programmer error: bad argument shape or range
			NotInitialized,        ///< Engine used before successful initialization
			StorageError,          ///< Key-value store read/write failure
			Internal               ///< Unexpected exception escaped an operation
		};

		/**
		 * @brief Error information carried out of a failed operation.
		 */
		struct Error {
			ErrorKind kind = ErrorKind::None;
			std::string message;

			[[nodiscard]] bool hasError() const noexcept {
				return kind != ErrorKind::None;
			}

			void clear() noexcept {
				kind = ErrorKind::None;
				message.clear();
			}

			/// @brief "Kind: message" form used in logs and decisions
			[[nodiscard]] std::string ToString() const;
		};

		/**
		 * @brief Fill an optional out-parameter. No-op when @p err is null.
		 */
		void SetError(Error* err, ErrorKind kind, std::string message);

		/**
		 * @brief Stable name of an error kind.
		 */
		[[nodiscard]] std::string_view GetErrorKindName(ErrorKind kind) noexcept;

		/**
		 * @brief True for kinds that must keep the engine from becoming ready.
		 */
		[[nodiscard]] bool IsFatal(ErrorKind kind) noexcept;

	}  // namespace Core
}  // namespace PhishGuard
