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
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

namespace PhishGuard {
	namespace Utils {

		namespace fs = std::filesystem;

		LogLevel ParseLogLevel(const std::string& name) noexcept {
			std::string lower;
			lower.reserve(name.size());
			for (char c : name) {
				lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
			}
			if (lower == "trace") return LogLevel::Trace;
			if (lower == "debug") return LogLevel::Debug;
			if (lower == "warn" || lower == "warning") return LogLevel::Warn;
			if (lower == "error") return LogLevel::Error;
			if (lower == "fatal") return LogLevel::Fatal;
			return LogLevel::Info;
		}

		const char* GetLogLevelName(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			default:              return "?";
			}
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			if (m_initialized.load()) {
				ShutDown();
			}

			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				m_cfg = cfg;
			}
			m_minLevel.store(cfg.minimalLevel);

			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_stop = false;
				m_queue.clear();
			}

			if (cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}
			m_initialized.store(true);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false)) {
				return;
			}

			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_stop = true;
			}
			m_queueCv.notify_all();
			m_spaceCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_file.is_open()) {
				m_file.flush();
				m_file.close();
			}
			m_currentSize = 0;
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load();
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >= static_cast<uint8_t>(m_minLevel.load());
		}

		// ============================================================================
		// Logging entry points
		// ============================================================================

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return {};

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);
			if (needed <= 0) return {};

			std::vector<char> buffer(static_cast<size_t>(needed) + 1);
			std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
			return std::string(buffer.data(), static_cast<size_t>(needed));
		}

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!IsInitialized() || !IsEnabled(level)) return;

			va_list args;
			va_start(args, format);
			std::string message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function);
		}

		void Logger::LogMessage(LogLevel level,
		                        const char* category,
		                        const std::string& message,
		                        const char* file,
		                        int line,
		                        const char* function) {
			if (!IsInitialized() || !IsEnabled(level)) return;

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.line = line;
			item.ts = std::chrono::system_clock::now();

			bool includeSrc = true;
			bool includeTid = true;
			bool async = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				includeSrc = m_cfg.includeSrcLocation;
				includeTid = m_cfg.includeThreadId;
				async = m_cfg.async;
			}

			if (includeSrc) {
				if (file) {
					// Basename keeps log lines short
					item.file = fs::path(file).filename().string();
				}
				item.function = function ? function : "";
			}
			if (includeTid) {
				std::ostringstream oss;
				oss << std::this_thread::get_id();
				item.threadId = oss.str();
			}

			if (async) {
				Enqueue(std::move(item));
			} else {
				Write(item);
			}
		}

		void Logger::Flush() {
			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				m_spaceCv.wait(lock, [this] { return m_queue.empty() || m_stop; });
			}
			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_file.is_open()) m_file.flush();
			std::cerr.flush();
		}

		// ============================================================================
		// Async queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			size_t maxQueue = 0;
			LoggerConfig::BackPressurePolicy policy;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				maxQueue = m_cfg.maxQueueSize;
				policy = m_cfg.bpPolicy;
			}

			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				if (m_stop) return;

				if (maxQueue > 0 && m_queue.size() >= maxQueue) {
					switch (policy) {
					case LoggerConfig::BackPressurePolicy::Block:
						m_spaceCv.wait(lock, [&] { return m_queue.size() < maxQueue || m_stop; });
						if (m_stop) return;
						break;
					case LoggerConfig::BackPressurePolicy::DropOldest:
						m_queue.pop_front();
						break;
					case LoggerConfig::BackPressurePolicy::DropNewest:
						return;
					}
				}
				m_queue.push_back(std::move(item));
			}
			m_queueCv.notify_one();
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] { return m_stop || !m_queue.empty(); });
					if (m_queue.empty()) {
						if (m_stop) break;
						continue;
					}
					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_spaceCv.notify_all();
				Write(item);
			}
			m_spaceCv.notify_all();
		}

		// ============================================================================
		// Output
		// ============================================================================

		void Logger::Write(const LogItem& item) {
			LoggerConfig cfg;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				cfg = m_cfg;
			}

			const std::string text = cfg.jsonLines ? FormatAsJson(item) : FormatPlain(item);

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (cfg.toConsole) {
				WriteConsole(text, item.level);
			}
			if (cfg.toFile) {
				WriteFile(text);
				if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(cfg.flushLevel) && m_file.is_open()) {
					m_file.flush();
				}
			}
		}

		void Logger::WriteConsole(const std::string& text, LogLevel level) {
			std::cerr << text << '\n';
			if (level >= LogLevel::Error) std::cerr.flush();
		}

		void Logger::WriteFile(const std::string& text) {
			RotateIfNeeded(text.size() + 1);
			OpenLogFileIfNeeded();
			if (!m_file.is_open()) return;

			m_file << text << '\n';
			m_currentSize += text.size() + 1;
		}

		std::string Logger::FormatIso8601UTC(std::chrono::system_clock::time_point ts) {
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
				ts.time_since_epoch()).count() % 1000;
			const std::time_t t = std::chrono::system_clock::to_time_t(ts);
			std::tm tm{};
			gmtime_r(&t, &tm);

			char buf[40];
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
				tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
				tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
			return buf;
		}

		std::string Logger::FormatPlain(const LogItem& item) const {
			std::string out;
			out.reserve(item.message.size() + 96);
			out += FormatIso8601UTC(item.ts);
			out += " [";
			out += GetLogLevelName(item.level);
			out += "] ";
			if (!item.threadId.empty()) {
				out += "[tid:";
				out += item.threadId;
				out += "] ";
			}
			if (!item.category.empty()) {
				out += '[';
				out += item.category;
				out += "] ";
			}
			out += item.message;
			if (!item.file.empty()) {
				out += " (";
				out += item.file;
				out += ':';
				out += std::to_string(item.line);
				if (!item.function.empty()) {
					out += ' ';
					out += item.function;
				}
				out += ')';
			}
			return out;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			nlohmann::json j;
			j["ts"] = FormatIso8601UTC(item.ts);
			j["level"] = GetLogLevelName(item.level);
			j["category"] = item.category;
			j["message"] = item.message;
			if (!item.threadId.empty()) j["tid"] = item.threadId;
			if (!item.file.empty()) {
				j["file"] = item.file;
				j["line"] = item.line;
				j["function"] = item.function;
			}
			// Invalid UTF-8 in a URL must not take the logger down
			return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
		}

		std::string Logger::CurrentLogPath() const {
			return (fs::path(m_cfg.logDirectory) / (m_cfg.baseFileName + ".log")).string();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file.is_open()) return;

			std::string path;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				std::error_code ec;
				fs::create_directories(m_cfg.logDirectory, ec);
				path = CurrentLogPath();
			}

			m_file.open(path, std::ios::out | std::ios::app);
			if (m_file.is_open()) {
				std::error_code ec;
				const auto size = fs::file_size(path, ec);
				m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
			}
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			uint64_t maxSize = 0;
			size_t maxCount = 0;
			std::string dir;
			std::string base;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				maxSize = m_cfg.maxFileSizeBytes;
				maxCount = m_cfg.maxFileCount;
				dir = m_cfg.logDirectory;
				base = m_cfg.baseFileName;
			}
			if (maxSize == 0 || m_currentSize + nextWriteBytes <= maxSize || !m_file.is_open()) {
				return;
			}

			m_file.close();

			std::error_code ec;
			const fs::path root(dir);
			auto rotated = [&](size_t index) {
				return root / (base + "." + std::to_string(index) + ".log");
			};

			if (maxCount > 0) {
				fs::remove(rotated(maxCount), ec);
				for (size_t i = maxCount; i > 1; --i) {
					if (fs::exists(rotated(i - 1), ec)) {
						fs::rename(rotated(i - 1), rotated(i), ec);
					}
				}
				fs::rename(root / (base + ".log"), rotated(1), ec);
			} else {
				fs::remove(root / (base + ".log"), ec);
			}
			m_currentSize = 0;
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
		                     const char* file,
		                     int line,
		                     const char* function,
		                     const char* messageOnEnter,
		                     LogLevel level)
			: m_category(category)
			, m_file(file)
			, m_function(function)
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter",
					m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) return;

			const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start).count();
			lg.LogMessage(m_level, m_category, "Exit (" + std::to_string(us) + " us)",
				m_file, m_line, m_function);
		}

	}  // namespace Utils
}  // namespace PhishGuard
