// WorkStealDeque_impl.hpp
#pragma once

template <class T>
typename WorkStealDeque<T>::size_type WorkStealDeque<T>::roundUpPow2_(size_type n) noexcept {
    size_type p = 1;
    while (p < n) p <<= 1;
    return p;
}

template <class T>
WorkStealDeque<T>::WorkStealDeque(size_type capacity)
    : capacity_(capacity == 0 ? 1 : capacity),
      mask_(roundUpPow2_(capacity_) - 1),
      buffer_(new value_type[mask_ + 1]{}) {}


template <class T>
bool WorkStealDeque<T>::push(const value_type& v) noexcept {
    int64_t b = bottom_.load(std::memory_order_relaxed);
    int64_t t = top_.load(std::memory_order_acquire);

    if (b - t >= static_cast<int64_t>(capacity_)) {
        return false;   // 满：由调用方决定背压策略
    }

    buffer_[static_cast<size_type>(b) & mask_] = v;
    // 槽位写入必须先于 bottom 的发布
    std::atomic_thread_fence(std::memory_order_release);
    bottom_.store(b + 1, std::memory_order_relaxed);
    return true;
}

template <class T>
std::optional<T> WorkStealDeque<T>::pop() noexcept {
    int64_t b = bottom_.load(std::memory_order_relaxed) - 1;
    bottom_.store(b, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    int64_t t = top_.load(std::memory_order_relaxed);

    if (t > b) {
        // 空队列，恢复 bottom
        bottom_.store(b + 1, std::memory_order_relaxed);
        return std::nullopt;
    }

    value_type item = buffer_[static_cast<size_type>(b) & mask_];
    if (t != b) {
        return item;    // 不止一个元素，不会与窃取者冲突
    }

    // 最后一个元素：与窃取者在 top 上竞争
    bool won = top_.compare_exchange_strong(t, t + 1,
                                            std::memory_order_seq_cst,
                                            std::memory_order_relaxed);
    bottom_.store(b + 1, std::memory_order_relaxed);
    if (!won) {
        return std::nullopt;
    }
    return item;
}

template <class T>
std::optional<T> WorkStealDeque<T>::steal() noexcept {
    int64_t t = top_.load(std::memory_order_acquire);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    int64_t b = bottom_.load(std::memory_order_acquire);

    if (t >= b) {
        return std::nullopt;
    }

    value_type item = buffer_[static_cast<size_type>(t) & mask_];
    if (!top_.compare_exchange_strong(t, t + 1,
                                      std::memory_order_seq_cst,
                                      std::memory_order_relaxed)) {
        return std::nullopt;    // 输给了所有者或其他窃取者
    }
    return item;
}

template <class T>
typename WorkStealDeque<T>::size_type WorkStealDeque<T>::size() const noexcept {
    int64_t b = bottom_.load(std::memory_order_acquire);
    int64_t t = top_.load(std::memory_order_acquire);
    return b > t ? static_cast<size_type>(b - t) : 0;
}

template <class T>
bool WorkStealDeque<T>::isEmpty() const noexcept {
    return size() == 0;
}
