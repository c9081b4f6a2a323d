#pragma once

#include "errors.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Result of one isolated unit of work: either a value or a recorded failure.
template <typename T>
struct Outcome {
    std::string subject;
    std::optional<T> value;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    bool ok() const { return value.has_value(); }
};

// Unbounded multi-producer queue drained by a single consumer.
template <typename T>
class ResultChannel {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    T pop() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [&]{ return !items_.empty(); });
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

private:
    std::deque<T> items_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

// Runs fn(i) for every index of subjects on at most max_concurrency threads.
// A failing subject never cancels or delays its siblings. Outcomes come back
// in input order.
template <typename T, typename Fn>
std::vector<Outcome<T>> run_isolated(const std::vector<std::string>& subjects,
                                     int max_concurrency,
                                     Fn fn) {
    const std::size_t n = subjects.size();
    std::vector<Outcome<T>> outcomes(n);
    if (n == 0) return outcomes;

    ResultChannel<std::pair<std::size_t, Outcome<T>>> channel;
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            std::size_t i = next++;
            if (i >= n) break;
            Outcome<T> out;
            out.subject = subjects[i];
            try {
                out.value = fn(i);
            } catch (const PipelineError& e) {
                out.error_kind = e.kind();
                out.error = e.what();
            } catch (const std::exception& e) {
                out.error_kind = ErrorKind::Unknown;
                out.error = e.what();
            }
            channel.push(std::make_pair(i, std::move(out)));
        }
    };

    std::size_t threads = static_cast<std::size_t>(std::max(1, max_concurrency));
    threads = std::min(threads, n);
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) pool.emplace_back(worker);

    for (std::size_t received = 0; received < n; ++received) {
        auto item = channel.pop();
        outcomes[item.first] = std::move(item.second);
    }
    for (auto& t : pool) t.join();
    return outcomes;
}
