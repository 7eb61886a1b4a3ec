#include "poolhttp/retry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>
#include <thread>

#include "poolhttp/headers.hpp"

namespace poolhttp {

    namespace {

        std::string budget_str(const std::optional<int>& v) {
            return v ? std::to_string(*v) : std::string("none");
        }

        void decrement(std::optional<int>& budget) {
            if (budget) --*budget;
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() &&
                   std::isspace(static_cast<unsigned char>(s.front())))
                s.remove_prefix(1);
            while (!s.empty() &&
                   std::isspace(static_cast<unsigned char>(s.back())))
                s.remove_suffix(1);
            return s;
        }

        /// @brief Seconds from now until an HTTP-date (IMF-fixdate, RFC 850
        /// or asctime), or nullopt.
        std::optional<double> seconds_until_http_date(std::string_view value) {
            // asctime pads single-digit days with a space
            std::string collapsed;
            collapsed.reserve(value.size());
            for (char c : value) {
                if (c == ' ' && !collapsed.empty() && collapsed.back() == ' ')
                    continue;
                collapsed.push_back(c);
            }

            static constexpr const char* kFormats[] = {
                "%a, %d %b %Y %H:%M:%S GMT",  // IMF-fixdate
                "%A, %d-%b-%y %H:%M:%S GMT",  // RFC 850
                "%a %b %d %H:%M:%S %Y",       // asctime
            };

            for (const char* fmt : kFormats) {
                std::tm tm{};
                std::istringstream in(collapsed);
                in.imbue(std::locale::classic());
                in >> std::get_time(&tm, fmt);
                if (in.fail()) continue;

                const std::time_t when = ::timegm(&tm);
                if (when == static_cast<std::time_t>(-1)) continue;

                const auto now = std::chrono::system_clock::to_time_t(
                    std::chrono::system_clock::now());
                return std::difftime(when, now);
            }
            return std::nullopt;
        }

        double uniform_jitter(double upper) {
            thread_local std::mt19937_64 rng{std::random_device{}()};
            std::uniform_real_distribution<double> dist(0.0, upper);
            return dist(rng);
        }

        VoidResult sleep_seconds(Seconds d, const CancellationToken* cancel) {
            if (cancel != nullptr) {
                if (cancel->is_cancelled() ||
                    (d.count() > 0 && !cancel->sleep_for(d))) {
                    return VoidResult::err(ErrorCode::Cancelled,
                                           "Retry sleep cancelled");
                }
                return VoidResult::ok();
            }
            if (d.count() > 0) std::this_thread::sleep_for(d);
            return VoidResult::ok();
        }

    }  // namespace

    Retry::Retry(RetryConfiguration cfg, std::vector<RequestHistory> history)
        : m_cfg(std::move(cfg)), m_history(std::move(history)) {
        std::set<std::string> lowered;
        for (const auto& name : m_cfg.remove_headers_on_redirect)
            lowered.insert(header_utils::to_lower(name));
        m_cfg.remove_headers_on_redirect = std::move(lowered);
    }

    Retry Retry::from_int(std::optional<int> retries, bool redirect) {
        RetryConfiguration cfg;
        cfg.total = retries.value_or(kDefaultRetries);
        if (!redirect) {
            cfg.redirect = 0;
            cfg.raise_on_redirect = false;
        }
        return Retry(std::move(cfg));
    }

    Retry Retry::disabled() {
        RetryConfiguration cfg;
        cfg.disabled = true;
        cfg.total = 0;
        cfg.redirect = 0;
        cfg.raise_on_redirect = false;
        return Retry(std::move(cfg));
    }

    bool Retry::is_exhausted() const noexcept {
        std::optional<int> lowest;
        for (const auto* b : {&m_cfg.total, &m_cfg.connect, &m_cfg.read,
                              &m_cfg.redirect, &m_cfg.status, &m_cfg.other}) {
            // Unset budgets are unlimited; zero budgets are not considered
            if (!b->has_value() || **b == 0) continue;
            lowest = lowest ? std::min(*lowest, **b) : **b;
        }
        return lowest && *lowest < 0;
    }

    bool Retry::is_method_retryable(HttpMethod method) const {
        if (!m_cfg.allowed_methods) return true;
        return m_cfg.allowed_methods->count(method) > 0;
    }

    bool Retry::is_retry(HttpMethod method, int status_code,
                         bool has_retry_after) const {
        if (m_cfg.disabled || !is_method_retryable(method)) return false;

        if (m_cfg.status_forcelist.count(status_code) > 0) return true;

        return m_cfg.respect_retry_after_header && has_retry_after &&
               std::find(kRetryAfterStatusCodes.begin(),
                         kRetryAfterStatusCodes.end(),
                         status_code) != kRetryAfterStatusCodes.end();
    }

    Result<Retry> Retry::increment(HttpMethod method, const std::string& url,
                                   const Error& error) const {
        return increment_impl(method, url, &error, nullptr);
    }

    Result<Retry> Retry::increment(HttpMethod method, const std::string& url,
                                   const Response& response) const {
        return increment_impl(method, url, nullptr, &response);
    }

    Result<Retry> Retry::increment_impl(HttpMethod method,
                                        const std::string& url,
                                        const Error* error,
                                        const Response* response) const {
        if (m_cfg.disabled && error != nullptr) {
            return Result<Retry>::err(*error);
        }

        RetryConfiguration next = m_cfg;
        decrement(next.total);

        RequestHistory entry;
        entry.method = std::string(poolhttp::to_string(method));
        entry.url = url;

        std::string cause = "unknown error";

        if (error != nullptr && is_connect_error(error->code)) {
            decrement(next.connect);
        } else if (error != nullptr && is_read_error(error->code)) {
            if (!is_method_retryable(method)) {
                return Result<Retry>::err(*error);
            }
            decrement(next.read);
        } else if (error != nullptr) {
            decrement(next.other);
        } else if (response != nullptr && response->redirect_location()) {
            decrement(next.redirect);
            cause = "too many redirects";
            entry.status = response->status_code;
            entry.redirect_location = response->redirect_location();
        } else if (response != nullptr && response->status_code != 0) {
            decrement(next.status);
            cause = "too many " + std::to_string(response->status_code) +
                    " error responses";
            entry.status = response->status_code;
        }

        if (error != nullptr) {
            entry.error = error->code;
            entry.error_message = error->message;
            cause = error->message;
        }

        std::vector<RequestHistory> history = m_history;
        history.push_back(std::move(entry));

        Retry new_retry(std::move(next), std::move(history));

        if (new_retry.is_exhausted()) {
            Error e;
            e.code = ErrorCode::MaxRetryExceeded;
            e.message = "Max retries exceeded with url: " + url +
                        " (Caused by " + cause + ")";
            e.history = new_retry.m_history;
            if (response != nullptr) e.status = response->status_code;
            SPDLOG_WARN("{}", e.message);
            return Result<Retry>::err(std::move(e));
        }

        SPDLOG_DEBUG("Incremented Retry for (url='{}'): {}", url,
                     new_retry.to_string());
        return Result<Retry>::ok(std::move(new_retry));
    }

    Seconds Retry::get_backoff_time() const {
        // Only consecutive failures count; a redirect starts over.
        std::size_t consecutive = 0;
        for (auto it = m_history.rbegin(); it != m_history.rend(); ++it) {
            if (it->redirect_location) break;
            ++consecutive;
        }
        if (consecutive <= 1) return Seconds{0.0};

        double value = m_cfg.backoff_factor *
                       std::pow(2.0, static_cast<double>(consecutive - 1));
        if (m_cfg.backoff_jitter > 0.0) {
            value += uniform_jitter(m_cfg.backoff_jitter);
        }
        value = std::clamp(value, 0.0, m_cfg.backoff_max.count());
        return Seconds{value};
    }

    std::optional<Seconds> Retry::parse_retry_after(
        std::string_view value) const {
        value = trim(value);
        if (value.empty()) return std::nullopt;

        double seconds = 0.0;
        const bool all_digits =
            std::all_of(value.begin(), value.end(), [](unsigned char c) {
                return std::isdigit(c) != 0;
            });

        if (all_digits) {
            long long n = 0;
            auto [ptr, ec] =
                std::from_chars(value.data(), value.data() + value.size(), n);
            (void)ptr;
            // Too many digits to represent: far beyond any cap
            seconds = (ec == std::errc()) ? static_cast<double>(n)
                                          : m_cfg.retry_after_max.count();
        } else {
            auto until = seconds_until_http_date(value);
            if (!until || *until < 0) return std::nullopt;
            seconds = *until;
        }

        return Seconds{std::min(seconds, m_cfg.retry_after_max.count())};
    }

    std::optional<Seconds> Retry::get_retry_after(
        const Response& response) const {
        const std::string* value = response.header("Retry-After");
        if (value == nullptr) return std::nullopt;
        return parse_retry_after(*value);
    }

    Result<bool> Retry::sleep_for_retry(const Response& response,
                                        const CancellationToken* cancel) const {
        auto delay = get_retry_after(response);
        if (!delay) return Result<bool>::ok(false);

        SPDLOG_DEBUG("Sleeping {}s as requested by Retry-After",
                     delay->count());
        auto slept = sleep_seconds(*delay, cancel);
        if (slept.has_error()) return Result<bool>::err(slept.error());
        return Result<bool>::ok(true);
    }

    VoidResult Retry::sleep(const Response* response,
                            const CancellationToken* cancel) const {
        if (response != nullptr && m_cfg.respect_retry_after_header) {
            auto slept = sleep_for_retry(*response, cancel);
            if (slept.has_error()) return VoidResult::err(slept.error());
            if (slept.value()) return VoidResult::ok();
        }

        const Seconds backoff = get_backoff_time();
        if (backoff.count() > 0) {
            SPDLOG_DEBUG("Backing off {}s before retrying", backoff.count());
        }
        return sleep_seconds(backoff, cancel);
    }

    std::string Retry::to_string() const {
        return "Retry(total=" + budget_str(m_cfg.total) +
               ", connect=" + budget_str(m_cfg.connect) +
               ", read=" + budget_str(m_cfg.read) +
               ", redirect=" + budget_str(m_cfg.redirect) +
               ", status=" + budget_str(m_cfg.status) + ")";
    }

}  // namespace poolhttp
