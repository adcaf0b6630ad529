#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stop_token>

// Thread-safe bounded queue; push/pop give up once the token is stopped
template<class T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t cap) : cap_(cap) {}

    bool push(T&& v, std::stop_token const& tk) {
        std::unique_lock lk(m_);
        if (!cv_not_full_.wait(lk, tk, [&] { return q_.size() < cap_; }))
            return false;
        q_.emplace_back(std::move(v));
        cv_not_empty_.notify_one();
        return true;
    }

    bool pop(T& out, std::stop_token const& tk) {
        std::unique_lock lk(m_);
        if (!cv_not_empty_.wait(lk, tk, [&] { return !q_.empty(); }))
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        cv_not_full_.notify_one();
        return true;
    }

private:
    std::mutex m_;
    std::condition_variable_any cv_not_empty_, cv_not_full_;
    std::deque<T> q_;
    std::size_t const cap_;
};
