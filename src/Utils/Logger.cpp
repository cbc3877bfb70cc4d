/*
 * TraceSweep - Browser Artifact Detection and Removal Engine
 * Copyright (C) 2026 TraceSweep Contributors
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
#include <cstring>
#include <ctime>
#include <filesystem>
#include <functional>
#include <system_error>

#ifdef _WIN32
#  include <process.h>
#else
#  include <unistd.h>
#endif

namespace TraceSweep {

	namespace Utils {

		namespace {

			uint32_t CurrentPid() noexcept {
#ifdef _WIN32
				return static_cast<uint32_t>(_getpid());
#else
				return static_cast<uint32_t>(::getpid());
#endif
			}

			uint64_t CurrentTid() noexcept {
				return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			}

		}  // namespace

		const char* LogLevelToString(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			default:              return "UNKNOWN";
			}
		}

		bool ParseLogLevel(std::string_view name, LogLevel& out) noexcept {
			std::string upper(name);
			std::transform(upper.begin(), upper.end(), upper.begin(),
				[](unsigned char c) { return static_cast<char>(std::toupper(c)); });

			if (upper == "TRACE") { out = LogLevel::Trace; return true; }
			if (upper == "DEBUG") { out = LogLevel::Debug; return true; }
			if (upper == "INFO")  { out = LogLevel::Info;  return true; }
			if (upper == "WARN" || upper == "WARNING") { out = LogLevel::Warn; return true; }
			if (upper == "ERROR") { out = LogLevel::Error; return true; }
			if (upper == "FATAL") { out = LogLevel::Fatal; return true; }
			return false;
		}

		Logger& Logger::Instance()
		{
			static Logger g_instance;
			return g_instance;
		}

		Logger::Logger() = default;

		Logger::~Logger()
		{
			ShutDown();
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			const LogLevel minLevel = m_minLevel.load(std::memory_order_acquire);
			return static_cast<int>(level) >= static_cast<int>(minLevel);
		}

		bool Logger::IsInitialized() const noexcept
		{
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			bool expected = false;

			if (!m_initialized.compare_exchange_strong(expected, true)) {
				// already running: swap the configuration, keep the worker
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				const bool fileChanged = cfg.logDirectory != m_cfg.logDirectory ||
					cfg.baseFileName != m_cfg.baseFileName || cfg.toFile != m_cfg.toFile;
				const bool asyncMode = m_cfg.async;
				m_cfg = cfg;
				m_cfg.async = asyncMode;
				if (fileChanged && m_file) {
					std::fclose(m_file);
					m_file = nullptr;
					m_currentSize = 0;
				}
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
				m_accepting.store(true, std::memory_order_release);
				return;
			}

			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				m_cfg = cfg;
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			}

			m_stop.store(false, std::memory_order_release);

			// worker must exist before messages are accepted
			if (m_cfg.async) {
				try {
					m_worker = std::thread([this]() { WorkerLoop(); });
				}
				catch (const std::system_error& ex) {
					std::fprintf(stderr, "[Logger] worker thread failed (%s), using synchronous mode\n", ex.what());
					m_cfg.async = false;
				}
			}

			m_accepting.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			bool expected = true;
			if (!m_initialized.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
				return;
			}

			m_accepting.store(false, std::memory_order_release);
			m_stop.store(true, std::memory_order_release);
			m_queueCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			LogItem item;
			while (Dequeue(item)) {
				Dispatch(item);
			}

			std::lock_guard<std::mutex> lk(m_cfgMutex);
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
			m_currentSize = 0;
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		void Logger::Enqueue(LogItem&& item) {
			if (!m_accepting.load(std::memory_order_acquire)) return;
			if (!IsInitialized()) return;
			if (!IsEnabled(item.level)) return;

			if (m_cfg.async) {
				std::unique_lock<std::mutex> lk(m_queueMutex);

				if (m_queue.size() >= m_cfg.maxQueueSize) {
					switch (m_cfg.bpPolicy) {
					case LoggerConfig::BackPressurePolicy::Block:
						m_queueCv.wait(lk, [this]() {
							return m_queue.size() < m_cfg.maxQueueSize || m_stop.load(std::memory_order_acquire);
						});
						if (m_stop.load(std::memory_order_acquire)) return;
						break;
					case LoggerConfig::BackPressurePolicy::DropOldest:
						m_queue.pop_front();
						break;
					case LoggerConfig::BackPressurePolicy::DropNewest:
						return;
					}
				}

				m_queue.emplace_back(std::move(item));
				m_queueCv.notify_all();
			}
			else {
				Dispatch(item);
			}
		}

		bool Logger::Dequeue(LogItem& out) {
			std::lock_guard<std::mutex> lk(m_queueMutex);
			if (m_queue.empty()) return false;
			out = std::move(m_queue.front());
			m_queue.pop_front();
			m_queueCv.notify_all();
			return true;
		}

		void Logger::Dispatch(const LogItem& item) {
			if (m_cfg.toConsole) WriteConsole(item);
			if (m_cfg.toFile) WriteFile(item);
		}

		void Logger::WorkerLoop() {
			while (true) {
				LogItem item;

				{
					std::unique_lock<std::mutex> lk(m_queueMutex);
					m_queueCv.wait_for(lk, std::chrono::seconds(1), [this]() {
						return m_stop.load(std::memory_order_acquire) || !m_queue.empty();
					});

					if (m_stop.load(std::memory_order_acquire) && m_queue.empty()) break;
					if (m_queue.empty()) continue;

					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_queueCv.notify_all();

				Dispatch(item);
			}
		}

		void Logger::LogEx(LogLevel level,
			const char* category,
			const char* file,
			int line,
			const char* function,
			const char* format, ...) {

			if (!IsEnabled(level)) return;

			va_list args;
			va_start(args, format);
			std::string msg = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, msg, file, line, function, 0);
		}

		void Logger::LogErrnoEx(LogLevel level,
			const char* category,
			const char* file,
			int line,
			const char* function,
			int errorCode,
			const char* contextFormat, ...) {

			if (!IsEnabled(level)) return;

			va_list args;
			va_start(args, contextFormat);
			std::string context = FormatMessageV(contextFormat, args);
			va_end(args);

			std::string combined;
			combined.reserve(context.size() + 64);
			combined.append(context);
			combined.append(": ");
			combined.append(std::strerror(errorCode));

			LogMessage(level, category, combined, file, line, function, errorCode);
		}

		void Logger::LogMessage(LogLevel level,
			const char* category,
			const std::string& message,
			const char* file,
			int line,
			const char* function,
			int osError) {

			LogItem item{};
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = file ? file : "";
			item.function = function ? function : "";
			item.line = line;
			item.pid = CurrentPid();
			item.tid = CurrentTid();
			item.ts = std::chrono::system_clock::now();
			item.osError = osError;

			Enqueue(std::move(item));

			if (static_cast<int>(level) >= static_cast<int>(m_cfg.flushLevel))
				Flush();
		}

		void Logger::Flush()
		{
			if (m_cfg.async)
			{
				auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

				std::unique_lock<std::mutex> lk(m_queueMutex);
				m_queueCv.notify_all();
				m_queueCv.wait_until(lk, deadline, [this]() { return m_queue.empty(); });
			}

			std::lock_guard<std::mutex> lk(m_cfgMutex);
			if (m_file) std::fflush(m_file);
			std::fflush(stderr);
		}

		// Helpers

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return {};

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);

			if (needed <= 0) return {};

			std::string out(static_cast<size_t>(needed) + 1, '\0');
			std::vsnprintf(out.data(), out.size(), fmt, args);
			out.resize(static_cast<size_t>(needed));
			return out;
		}

		std::string Logger::FormatIso8601UTC(std::chrono::system_clock::time_point tp) {
			const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
				tp.time_since_epoch()).count() % 1000;

			std::tm utc{};
#ifdef _WIN32
			gmtime_s(&utc, &secs);
#else
			gmtime_r(&secs, &utc);
#endif
			char buf[40];
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
				utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
				utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
			return buf;
		}

		std::string Logger::EscapeJson(const std::string& s) {
			std::string out;
			out.reserve(s.size() + 8);
			for (const char ch : s) {
				switch (ch) {
				case '"':  out += "\\\""; break;
				case '\\': out += "\\\\"; break;
				case '\n': out += "\\n"; break;
				case '\r': out += "\\r"; break;
				case '\t': out += "\\t"; break;
				default:
					if (static_cast<unsigned char>(ch) < 0x20) {
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
						out += buf;
					}
					else {
						out.push_back(ch);
					}
				}
			}
			return out;
		}

		std::string Logger::FormatPrefix(const LogItem& item) const {
			std::string s;
			s.reserve(128);
			s += FormatIso8601UTC(item.ts);
			s += " [";
			s += LogLevelToString(item.level);
			s += "]";

			if (!item.category.empty())
			{
				s += " [";
				s += item.category;
				s += "]";
			}

			if (m_cfg.includeProcThreadId)
			{
				s += " (";
				s += std::to_string(item.pid);
				s += ":";
				s += std::to_string(item.tid % 100000);
				s += ")";
			}

			if (m_cfg.includeSrcLocation && !item.file.empty())
			{
				s += " ";
				s += std::filesystem::path(item.file).filename().string();
				s += ":";
				s += std::to_string(item.line);

				if (!item.function.empty())
				{
					s += " ";
					s += item.function;
				}
			}

			s += " - ";
			return s;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::string s;
			s.reserve(128 + item.message.size());
			s += "{\"ts\":\"";
			s += FormatIso8601UTC(item.ts);
			s += "\",\"lvl\":\"";
			s += LogLevelToString(item.level);
			s += "\"";

			if (!item.category.empty())
			{
				s += ",\"cat\":\"";
				s += EscapeJson(item.category);
				s += "\"";
			}

			if (m_cfg.includeProcThreadId)
			{
				s += ",\"pid\":";
				s += std::to_string(item.pid);
				s += ",\"tid\":";
				s += std::to_string(item.tid);
			}

			if (m_cfg.includeSrcLocation && !item.file.empty())
			{
				s += ",\"file\":\"";
				s += EscapeJson(item.file);
				s += "\",\"line\":";
				s += std::to_string(item.line);

				if (!item.function.empty())
				{
					s += ",\"func\":\"";
					s += EscapeJson(item.function);
					s += "\"";
				}
			}

			if (item.osError)
			{
				s += ",\"errno\":";
				s += std::to_string(item.osError);
			}

			s += ",\"msg\":\"";
			s += EscapeJson(item.message);
			s += "\"}";
			return s;
		}

		// Sinks

		void Logger::WriteConsole(const LogItem& item) {
			std::string line = m_cfg.jsonLines ? FormatAsJson(item) : (FormatPrefix(item) + item.message);
			line += '\n';

			std::lock_guard<std::mutex> lk(m_cfgMutex);
			std::fwrite(line.data(), 1, line.size(), stderr);
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) return;

			std::error_code ec;
			if (!m_cfg.logDirectory.empty()) {
				std::filesystem::create_directories(m_cfg.logDirectory, ec);
			}

			const std::string path = BaseLogPath();
			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::fprintf(stderr, "[Logger] Failed to open log file %s\n", path.c_str());
				return;
			}

			const auto size = std::filesystem::file_size(path, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (!m_file) return;
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) return;

			PerformRotation();
			OpenLogFileIfNeeded();
		}

		void Logger::PerformRotation()
		{
			bool expected = false;
			if (!m_insideRotation.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
				return;
			}

			struct RotationGuard {
				std::atomic<bool>& flag;
				~RotationGuard() { flag.store(false, std::memory_order_release); }
			} guard{ m_insideRotation };

			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}

			namespace fs = std::filesystem;
			std::error_code ec;
			const std::string base = BaseLogPath();

			if (m_cfg.maxFileCount > 1) {
				fs::remove(base + "." + std::to_string(m_cfg.maxFileCount), ec);

				for (size_t idx = m_cfg.maxFileCount - 1; idx >= 1; --idx) {
					const std::string src = base + "." + std::to_string(idx);
					const std::string dst = base + "." + std::to_string(idx + 1);
					if (fs::exists(src, ec)) {
						fs::rename(src, dst, ec);
					}
					if (idx == 1) break;
				}

				fs::rename(base, base + ".1", ec);
			}
			else {
				fs::remove(base, ec);
			}

			m_currentSize = 0;
		}

		std::string Logger::BaseLogPath() const
		{
			std::filesystem::path path = m_cfg.logDirectory;
			path /= m_cfg.baseFileName + ".log";
			return path.string();
		}

		void Logger::WriteFile(const LogItem& item)
		{
			std::string line = m_cfg.jsonLines ? FormatAsJson(item) : (FormatPrefix(item) + item.message);
			line += '\n';

			std::lock_guard<std::mutex> lk(m_cfgMutex);
			OpenLogFileIfNeeded();
			RotateIfNeeded(line.size());
			if (!m_file) return;

			const size_t written = std::fwrite(line.data(), 1, line.size(), m_file);
			m_currentSize += written;
		}

		Logger::Scope::Scope(const char* category,
			const char* file,
			int line,
			const char* function,
			const char* messageOnEnter,
			LogLevel level)
			: m_category(category ? category : "")
			, m_file(file ? file : "")
			, m_function(function ? function : "")
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level)
		{
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter", m_file, m_line, m_function, 0);
			}
		}

		Logger::Scope::~Scope()
		{
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) return;

			const double ms = std::chrono::duration<double, std::milli>(
				std::chrono::steady_clock::now() - m_start).count();

			char buf[64];
			std::snprintf(buf, sizeof(buf), "Leave (%.3f ms)", ms);
			lg.LogMessage(m_level, m_category, buf, m_file, m_line, m_function, 0);
		}

	}  // namespace Utils
}  // namespace TraceSweep
