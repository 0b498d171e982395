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
 * @file Logger.hpp
 * @brief Thread-safe logging system for PhishGuard.
 *
 * Provides:
 * - Synchronous or asynchronous logging with a configurable back-pressure policy
 * - Console and file output targets
 * - Size-based log rotation with a bounded number of rotated files
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 *
 * @note Thread-safe for all public methods.
 * @warning Messages logged before Initialize() are discarded.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

namespace PhishGuard {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages, least to most severe.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		/**
		 * @brief Parse a level name ("trace", "info", ...). Unknown names yield Info.
		 */
		[[nodiscard]] LogLevel ParseLogLevel(const std::string& name) noexcept;

		[[nodiscard]] const char* GetLogLevelName(LogLevel level) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			/// Maximum queue size for async logging
			size_t maxQueueSize = 1000;

			/// Policy when queue is full
			enum class BackPressurePolicy {
				Block,       ///< Block until space available
				DropOldest,  ///< Drop oldest messages
				DropNewest   ///< Drop newest messages
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;              ///< Enable asynchronous logging
			bool toConsole = true;          ///< Output to stderr
			bool toFile = false;            ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeThreadId = true;    ///< Include thread id

			std::string logDirectory = "logs";       ///< Log file directory
			std::string baseFileName = "phishguard"; ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 5;                 ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;  ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;   ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   PG_LOG_INFO("Engine", "Loaded %zu trees", count);
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 */
		class Logger {
		public:
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize (or re-initialize) the logger with configuration.
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Stop the worker thread and write remaining messages.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-style formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
				__attribute__((format(printf, 7, 8)))
#endif
				;

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr);

			void Flush();

			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger() = default;
			~Logger();

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				std::string threadId;
				std::chrono::system_clock::time_point ts;
			};

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			void Write(const LogItem& item);
			void WriteConsole(const std::string& text, LogLevel level);
			void WriteFile(const std::string& text);

			[[nodiscard]] std::string FormatPlain(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string FormatIso8601UTC(std::chrono::system_clock::time_point ts);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			[[nodiscard]] std::string CurrentLogPath() const;

			std::atomic<bool> m_initialized{ false };
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			LoggerConfig m_cfg{};
			mutable std::mutex m_cfgMutex;

			std::deque<LogItem> m_queue;
			std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::condition_variable m_spaceCv;
			std::thread m_worker;
			bool m_stop = false;

			/// Guards file and console output
			std::mutex m_writeMutex;
			std::ofstream m_file;
			uint64_t m_currentSize = 0;
		};

	}  // namespace Utils
}  // namespace PhishGuard

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   PG_LOG_INFO("Category", "Message with %d format", value);
//   PG_LOG_ERROR("Category", "Error occurred: %s", msg.c_str());
//   PG_LOG_SCOPE("Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define PG_LOG_AT(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::PhishGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

#define PG_LOG_TRACE(category, fmt, ...) PG_LOG_AT(::PhishGuard::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)
#define PG_LOG_DEBUG(category, fmt, ...) PG_LOG_AT(::PhishGuard::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)
#define PG_LOG_INFO(category, fmt, ...)  PG_LOG_AT(::PhishGuard::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)
#define PG_LOG_WARN(category, fmt, ...)  PG_LOG_AT(::PhishGuard::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)
#define PG_LOG_ERROR(category, fmt, ...) PG_LOG_AT(::PhishGuard::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)
#define PG_LOG_FATAL(category, fmt, ...) PG_LOG_AT(::PhishGuard::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define PG_LOG_CONCAT_INNER(a, b) a##b
#define PG_LOG_CONCAT(a, b) PG_LOG_CONCAT_INNER(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define PG_LOG_SCOPE(category) \
    ::PhishGuard::Utils::Logger::Scope PG_LOG_CONCAT(_pg_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __func__)
