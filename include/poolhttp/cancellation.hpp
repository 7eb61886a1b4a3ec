#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace poolhttp {

    /**
     * @brief Shared cancellation flag with an optional deadline.
     *
     * Copies share state: cancelling any copy wakes every sleeper. Used to
     * bound the whole retry loop of a request, including backoff sleeps.
     */
    class CancellationToken {
       public:
        using clock = std::chrono::steady_clock;

        CancellationToken() : m_state(std::make_shared<State>()) {}

        explicit CancellationToken(clock::time_point deadline)
            : m_state(std::make_shared<State>()) {
            m_state->deadline = deadline;
        }

        static CancellationToken with_timeout(clock::duration timeout) {
            return CancellationToken(clock::now() + timeout);
        }

        void cancel() noexcept {
            {
                std::lock_guard<std::mutex> lk(m_state->mu);
                m_state->cancelled = true;
            }
            m_state->cv.notify_all();
        }

        /// @brief True once cancel() was called or the deadline passed.
        bool is_cancelled() const {
            std::lock_guard<std::mutex> lk(m_state->mu);
            return expired_locked();
        }

        std::optional<clock::time_point> deadline() const {
            return m_state->deadline;
        }

        /// @brief Time left before the deadline; nullopt if there is none.
        std::optional<clock::duration> remaining() const {
            if (!m_state->deadline) return std::nullopt;
            auto left = *m_state->deadline - clock::now();
            return left < clock::duration::zero() ? clock::duration::zero()
                                                  : left;
        }

        /// @brief Sleep for `d` unless interrupted first.
        /// @return false if the token fired before `d` elapsed.
        template <typename Rep, typename Period>
        bool sleep_for(std::chrono::duration<Rep, Period> d) const {
            auto until =
                clock::now() + std::chrono::duration_cast<clock::duration>(d);
            std::unique_lock<std::mutex> lk(m_state->mu);
            if (m_state->deadline && *m_state->deadline < until) {
                m_state->cv.wait_until(lk, *m_state->deadline,
                                       [&] { return m_state->cancelled; });
                return false;
            }
            return !m_state->cv.wait_until(lk, until,
                                           [&] { return m_state->cancelled; });
        }

       private:
        struct State {
            std::mutex mu;
            std::condition_variable cv;
            bool cancelled{false};
            std::optional<clock::time_point> deadline;
        };

        bool expired_locked() const {
            return m_state->cancelled ||
                   (m_state->deadline && clock::now() >= *m_state->deadline);
        }

        std::shared_ptr<State> m_state;
    };

}  // namespace poolhttp
