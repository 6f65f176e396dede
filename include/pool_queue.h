#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "channel.h"
#include "logger.h"

namespace poolq::core {

// 由工厂预填充 pool 时使用的显式配置。
// 三个字段彼此独立，避免“容量 + 位置参数”写法中 queue 容量被误当成工厂参数。
template <class T>
struct PoolQueueOptions {
    std::size_t pool_capacity{0};
    std::size_t queue_capacity{0};
    std::function<T()> item_factory;
};

// PoolQueue：在一个生产者线程与一个消费者线程之间循环复用一组预分配的 item。
//
// 生产者：
//   T item = pq.acquire();   // 从 pool 取空闲 item
//   ...填充 item...
//   pq.produce(std::move(item));  // 放入 queue
//
// 消费者：
//   T item = pq.consume();   // 从 queue 取就绪 item
//   ...处理 item...
//   pq.recycle(std::move(item));  // 归还 pool
//
// pool 为空时 acquire 阻塞（所有 item 都在途），queue 满时 produce 阻塞（背压）。
// item 以 move 方式在两个通道间流转；若 T 持有堆内存（如 std::vector），流转过程不会重新分配。
template <class T>
class PoolQueue {
public:
    using value_type = T;
    using ChannelPtr = std::shared_ptr<Channel<T>>;

    PoolQueue(ChannelPtr pool, ChannelPtr queue) : pool_(std::move(pool)), queue_(std::move(queue)) {
        if (!pool_ || !queue_) {
            throw std::invalid_argument("pool and queue channels must not be null");
        }
    }

    // 新建两个空的有界通道；pool 需由调用方通过 recycle() 填充。
    explicit PoolQueue(std::size_t pool_capacity) : PoolQueue(pool_capacity, pool_capacity) {}

    PoolQueue(std::size_t pool_capacity, std::size_t queue_capacity)
        : PoolQueue(make_channel(pool_capacity, "pool"), make_channel(queue_capacity, "queue")) {}

    // 调用 item_factory 恰好 pool_capacity 次，并把结果依次放入 pool。
    explicit PoolQueue(const PoolQueueOptions<T>& opts) : PoolQueue(opts.pool_capacity, opts.queue_capacity) {
        if (!opts.item_factory) {
            throw std::invalid_argument("item_factory must be set");
        }
        for (std::size_t i = 0; i < opts.pool_capacity; ++i) {
            recycle(opts.item_factory());
        }
    }

    // 以 T(args...) 构造 pool_capacity 个 item 预填充 pool。
    template <class... Args>
    static PoolQueue emplace(std::size_t pool_capacity, std::size_t queue_capacity, const Args&... args) {
        PoolQueue pq(pool_capacity, queue_capacity);
        for (std::size_t i = 0; i < pool_capacity; ++i) {
            pq.recycle(T(args...));
        }
        return pq;
    }

    PoolQueue(const PoolQueue&) = delete;
    PoolQueue& operator=(const PoolQueue&) = delete;
    PoolQueue(PoolQueue&&) noexcept = default;
    PoolQueue& operator=(PoolQueue&&) noexcept = default;

    // 生产者侧 ---------------------------------------------------------------

    T acquire() { return pool_->take(); }

    void produce(T item) { queue_->put(std::move(item)); }

    // acquire 一个 item 并调用 f(item, extra...)，按 f 的返回类型决定放入 queue 的内容：
    // - bool：true 把 item 本身放入 queue；false 跳过本轮，item 回到 pool。
    // - std::optional<T>：有值时放入返回值；为空时跳过本轮，item 回到 pool。
    //   交回同一个 item 须写 return std::move(item)；return item 会复制出新对象。
    // 返回值表示是否向 queue 放入了 item（item 已移交 queue，不再返回 f 的结果本身）。
    // f 抛出的异常原样传播；传播前 item 以非阻塞方式归还 pool。
    template <class F, class... Extra, std::enable_if_t<std::is_invocable_v<F, T&, Extra...>, int> = 0>
    bool produce(F&& f, Extra&&... extra) {
        using R = std::invoke_result_t<F, T&, Extra...>;
        static_assert(std::is_same_v<R, bool> || std::is_convertible_v<R, std::optional<T>>,
                      "produce callback must return bool or std::optional of the item type");
        T item = acquire();
        if constexpr (std::is_same_v<R, bool>) {
            bool keep = false;
            try {
                keep = std::invoke(std::forward<F>(f), item, std::forward<Extra>(extra)...);
            } catch (...) {
                reclaim(item);
                throw;
            }
            if (!keep) {
                recycle(std::move(item));
                return false;
            }
            produce(std::move(item));
            return true;
        } else {
            std::optional<T> produced;
            try {
                produced = std::invoke(std::forward<F>(f), item, std::forward<Extra>(extra)...);
            } catch (...) {
                reclaim(item);
                throw;
            }
            if (!produced) {
                recycle(std::move(item));
                return false;
            }
            produce(std::move(*produced));
            return true;
        }
    }

    std::optional<T> try_acquire() { return pool_->try_take(); }

    // 消费者侧 ---------------------------------------------------------------

    T consume() { return queue_->take(); }

    void recycle(T item) { pool_->put(std::move(item)); }

    // 从 queue 取一个 item，调用 f(item, extra...)，并无条件回收：
    // - f 返回 void：回收传入的 item；
    // - f 返回 T&：引用指向传入的 item 时原样回收，否则从被引用的对象 move 出来回收；
    // - f 返回 T：回收返回值（可以是另一个对象）。
    // 消费侧没有“跳过回收”的路径，保证 pool 总能恢复容量。
    template <class F, class... Extra>
    void consume(F&& f, Extra&&... extra) {
        using R = std::invoke_result_t<F, T&, Extra...>;
        static_assert(std::is_void_v<R> ||
                          (std::is_lvalue_reference_v<R> &&
                           std::is_same_v<std::remove_cv_t<std::remove_reference_t<R>>, T>) ||
                          std::is_convertible_v<R, T>,
                      "consume callback must return void or the item type");
        T item = consume();
        if constexpr (std::is_void_v<R>) {
            try {
                std::invoke(std::forward<F>(f), item, std::forward<Extra>(extra)...);
            } catch (...) {
                reclaim(item);
                throw;
            }
            recycle(std::move(item));
        } else if constexpr (std::is_lvalue_reference_v<R> &&
                             std::is_same_v<std::remove_cv_t<std::remove_reference_t<R>>, T>) {
            std::remove_reference_t<R>* ret = nullptr;
            try {
                ret = std::addressof(std::invoke(std::forward<F>(f), item, std::forward<Extra>(extra)...));
            } catch (...) {
                reclaim(item);
                throw;
            }
            if (ret == std::addressof(item)) {
                recycle(std::move(item));
            } else {
                recycle(T(std::move(*ret)));
            }
        } else {
            std::optional<T> replacement;
            try {
                replacement.emplace(std::invoke(std::forward<F>(f), item, std::forward<Extra>(extra)...));
            } catch (...) {
                reclaim(item);
                throw;
            }
            recycle(std::move(*replacement));
        }
    }

    std::optional<T> try_consume() { return queue_->try_take(); }

    // 关闭 -------------------------------------------------------------------

    // 先关闭 queue 再关闭 pool：先释放阻塞在 consume 的消费者，再释放阻塞在 acquire/recycle 的生产者。
    void close() {
        queue_->close();
        pool_->close();
    }

    bool closed() const { return queue_->closed() && pool_->closed(); }

    // close 之后取回仍缓存在 queue 与 pool 中的 item（queue 在前）。
    std::vector<T> drain() {
        std::vector<T> out = queue_->drain();
        for (auto& item : pool_->drain()) {
            out.push_back(std::move(item));
        }
        return out;
    }

    // 观测 -------------------------------------------------------------------

    std::size_t pool_size() const { return pool_->size(); }
    std::size_t queue_size() const { return queue_->size(); }
    std::size_t pool_capacity() const { return pool_->capacity(); }
    std::size_t queue_capacity() const { return queue_->capacity(); }

    const ChannelPtr& pool() const { return pool_; }
    const ChannelPtr& queue() const { return queue_; }

private:
    static ChannelPtr make_channel(std::size_t capacity, const char* name) {
        if (capacity == 0) {
            throw std::invalid_argument(std::string(name) + " capacity must be positive");
        }
        return std::make_shared<BoundedChannel<T>>(capacity, name);
    }

    // 回调抛异常时把手上的 item 还给 pool；pool 已关闭时 item 随异常一起释放。
    void reclaim(T& item) {
        if (!pool_->try_put(item)) {
            Logger::getInstance().debug("poolqueue: pool unavailable, item released on callback error");
        }
    }

    ChannelPtr pool_;
    ChannelPtr queue_;
};

} // namespace poolq::core
