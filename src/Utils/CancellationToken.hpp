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
#pragma once
/**
 * @file CancellationToken.hpp
 * @brief Caller-owned cancel flag with an optional deadline.
 *
 * Every blocking loop in the engine (process polling, store liveness
 * retries, file removal retries) sleeps through SleepFor() so that a
 * Cancel() from another thread wakes it immediately.
 *
 * @note Thread-safe. Not copyable; pass by reference.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace TraceSweep {
	namespace Utils {

		class CancellationToken {
		public:
			using Clock = std::chrono::steady_clock;

			CancellationToken() = default;

			/// @brief Token whose deadline is now + timeout.
			explicit CancellationToken(Clock::duration timeout);

			CancellationToken(const CancellationToken&) = delete;
			CancellationToken& operator=(const CancellationToken&) = delete;

			/// @brief Set the manual cancel flag and wake every sleeper.
			void Cancel() noexcept;

			[[nodiscard]] bool IsCancelled() const noexcept;
			[[nodiscard]] bool DeadlineExceeded() const noexcept;

			/// @brief true once cancelled or past the deadline.
			[[nodiscard]] bool ShouldStop() const noexcept;

			void SetDeadline(Clock::time_point deadline);
			void ClearDeadline();
			[[nodiscard]] std::optional<Clock::time_point> Deadline() const;

			/**
			 * @brief Sleep for up to @p duration.
			 *
			 * Wakes early on Cancel() or when the deadline passes.
			 *
			 * @return true if the whole duration elapsed, false if woken early
			 */
			[[nodiscard]] bool SleepFor(Clock::duration duration) const;

		private:
			mutable std::mutex m_mutex;
			mutable std::condition_variable m_cv;
			std::atomic<bool> m_cancelled{ false };
			std::optional<Clock::time_point> m_deadline;
		};

	}  // namespace Utils
}  // namespace TraceSweep
