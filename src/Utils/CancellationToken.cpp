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
#include "CancellationToken.hpp"

namespace TraceSweep {
	namespace Utils {

		CancellationToken::CancellationToken(Clock::duration timeout)
			: m_deadline(Clock::now() + timeout)
		{
		}

		void CancellationToken::Cancel() noexcept {
			{
				std::lock_guard<std::mutex> lk(m_mutex);
				m_cancelled.store(true, std::memory_order_release);
			}
			m_cv.notify_all();
		}

		bool CancellationToken::IsCancelled() const noexcept {
			return m_cancelled.load(std::memory_order_acquire);
		}

		bool CancellationToken::DeadlineExceeded() const noexcept {
			std::lock_guard<std::mutex> lk(m_mutex);
			return m_deadline.has_value() && Clock::now() >= *m_deadline;
		}

		bool CancellationToken::ShouldStop() const noexcept {
			return IsCancelled() || DeadlineExceeded();
		}

		void CancellationToken::SetDeadline(Clock::time_point deadline) {
			{
				std::lock_guard<std::mutex> lk(m_mutex);
				m_deadline = deadline;
			}
			m_cv.notify_all();
		}

		void CancellationToken::ClearDeadline() {
			std::lock_guard<std::mutex> lk(m_mutex);
			m_deadline.reset();
		}

		std::optional<CancellationToken::Clock::time_point> CancellationToken::Deadline() const {
			std::lock_guard<std::mutex> lk(m_mutex);
			return m_deadline;
		}

		bool CancellationToken::SleepFor(Clock::duration duration) const {
			std::unique_lock<std::mutex> lk(m_mutex);

			Clock::time_point wakeAt = Clock::now() + duration;
			bool cutByDeadline = false;
			if (m_deadline && *m_deadline < wakeAt) {
				wakeAt = *m_deadline;
				cutByDeadline = true;
			}

			const bool cancelled = m_cv.wait_until(lk, wakeAt, [this]() {
				return m_cancelled.load(std::memory_order_acquire);
			});

			return !cancelled && !cutByDeadline;
		}

	}  // namespace Utils
}  // namespace TraceSweep
