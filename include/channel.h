#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "observability.h"

namespace poolq::core {

// 在已关闭的 channel 上执行阻塞 put/take 时抛出。
class ChannelClosed : public std::runtime_error {
public:
    explicit ChannelClosed(const std::string& channel)
        : std::runtime_error(channel.empty() ? std::string("channel closed") : "channel closed: " + channel),
          channel_(channel) {}

    const std::string& channel() const { return channel_; }

private:
    std::string channel_;
};

// 有界 FIFO 阻塞通道的抽象能力。
// - put：满时阻塞；take：空时阻塞。
// - close 之后，所有阻塞中与后续的 put/take 都抛出 ChannelClosed。
// - seal 之后，put 抛出 ChannelClosed；take 先取完已缓存的元素，通道取空后再抛出 ChannelClosed。
//   用于“有限输入源”：写端写完即 seal，读端读尽后自然结束。
template <class T>
class Channel {
public:
    using value_type = T;

    virtual ~Channel() = default;

    virtual void put(T item) = 0;
    virtual T take() = 0;

    // 非阻塞：满或已关闭时返回 false，item 保持不变。
    virtual bool try_put(T& item) = 0;
    // 非阻塞：空或已关闭时返回 empty。
    virtual std::optional<T> try_take() = 0;

    virtual void close() = 0;
    virtual bool closed() const = 0;

    virtual void seal() = 0;
    virtual bool sealed() const = 0;

    // close/seal 之后取回仍缓存在通道中的元素，交还给所有者。
    virtual std::vector<T> drain() = 0;

    virtual std::size_t size() const = 0;
    virtual std::size_t capacity() const = 0;
    bool ready() const { return size() > 0; }
};

template <class T>
class BoundedChannel final : public Channel<T> {
public:
    explicit BoundedChannel(std::size_t capacity, std::string name = {})
        : capacity_(capacity), name_(std::move(name)) {
        if (capacity_ == 0) {
            throw std::invalid_argument("channel capacity must be positive");
        }
    }

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    ~BoundedChannel() override { close(); }

    void put(T item) override {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_not_full_.wait(lk, [&]() { return closed_ || sealed_ || items_.size() < capacity_; });
        if (closed_ || sealed_) {
            lk.unlock();
            report_closed("put");
            throw ChannelClosed(name_);
        }
        items_.push_back(std::move(item));
        const auto sz = items_.size();
        lk.unlock();
        cv_not_empty_.notify_one();
        publish("poolq.channel.put", sz);
    }

    T take() override {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_not_empty_.wait(lk, [&]() { return closed_ || sealed_ || !items_.empty(); });
        if (closed_ || items_.empty()) {
            lk.unlock();
            report_closed("take");
            throw ChannelClosed(name_);
        }
        T out = std::move(items_.front());
        items_.pop_front();
        const auto sz = items_.size();
        lk.unlock();
        cv_not_full_.notify_one();
        publish("poolq.channel.take", sz);
        return out;
    }

    bool try_put(T& item) override {
        std::unique_lock<std::mutex> lk(mtx_);
        if (closed_ || sealed_ || items_.size() >= capacity_) return false;
        items_.push_back(std::move(item));
        const auto sz = items_.size();
        lk.unlock();
        cv_not_empty_.notify_one();
        publish("poolq.channel.put", sz);
        return true;
    }

    std::optional<T> try_take() override {
        std::unique_lock<std::mutex> lk(mtx_);
        if (closed_ || items_.empty()) return std::nullopt;
        std::optional<T> out(std::move(items_.front()));
        items_.pop_front();
        const auto sz = items_.size();
        lk.unlock();
        cv_not_full_.notify_one();
        publish("poolq.channel.take", sz);
        return out;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return;
            closed_ = true;
        }
        cv_not_full_.notify_all();
        cv_not_empty_.notify_all();
    }

    bool closed() const override {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    void seal() override {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_ || sealed_) return;
            sealed_ = true;
        }
        cv_not_full_.notify_all();
        cv_not_empty_.notify_all();
    }

    bool sealed() const override {
        std::lock_guard<std::mutex> lk(mtx_);
        return sealed_;
    }

    std::vector<T> drain() override {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<T> out;
        if (!closed_ && !sealed_) return out;
        out.reserve(items_.size());
        while (!items_.empty()) {
            out.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return out;
    }

    std::size_t size() const override {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.size();
    }

    std::size_t capacity() const override { return capacity_; }
    const std::string& name() const { return name_; }

private:
    void publish(const char* counter, std::size_t size) const {
        if (!has_metrics_sink()) return;
        metrics().counter_add(counter, 1, {{"channel", name_}});
        metrics().gauge_set("poolq.channel.size", static_cast<double>(size), {{"channel", name_}});
    }

    void report_closed(const char* op) const {
        if (!has_metrics_sink()) return;
        metrics().counter_add("poolq.channel.closed", 1, {{"channel", name_}, {"op", op}});
    }

    const std::size_t capacity_;
    const std::string name_;
    mutable std::mutex mtx_;
    std::condition_variable cv_not_full_;
    std::condition_variable cv_not_empty_;
    std::deque<T> items_;
    bool closed_{false};
    bool sealed_{false};
};

} // namespace poolq::core
