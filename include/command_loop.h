#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "channel.h"
#include "logger.h"
#include "observability.h"
#include "pool_queue.h"

namespace poolq::core {

struct CommandLoopOptions {
    std::string name{"command_loop"};
    // 退出时 seal PoolQueue 的 queue 并关闭命令源；pool 不在此关闭。
    // queue 以 seal 结束：消费者先取完已生产的 item，之后 consume 抛出 ChannelClosed。
    bool auto_close{true};
};

// 命令驱动的生产者循环：
//   while (true) { cmd = commands.take(); produce_fn(cmd, pq); }
//
// - 取命令失败（命令源关闭，或命令源自身抛出的任何异常）：视为命令流结束，Info 日志。
// - produce_fn 抛异常：异常结束，Warn 日志。
// 两种情况下 run() 都正常返回，不向调用方传播错误。
template <class T>
class CommandLoop {
public:
    enum class ExitReason { kNotRun, kEndOfCommands, kProductionFailed };

    using CommandSource = std::shared_ptr<Channel<std::string>>;
    using ProduceFn = std::function<void(const std::string& command, PoolQueue<T>& pq)>;

    CommandLoop(CommandSource commands,
                PoolQueue<T>& pq,
                ProduceFn produce_fn,
                CommandLoopOptions opts = {},
                const Logger& logger = Logger::getInstance())
        : commands_(std::move(commands)),
          pq_(&pq),
          produce_fn_(std::move(produce_fn)),
          opts_(std::move(opts)),
          logger_(&logger) {
        if (!commands_) throw std::invalid_argument("command source must not be null");
        if (!produce_fn_) throw std::invalid_argument("produce function must be set");
    }

    CommandLoop(const CommandLoop&) = delete;
    CommandLoop& operator=(const CommandLoop&) = delete;

    ~CommandLoop() { join(); }

    // 在当前线程执行循环，直到命令源结束或 produce_fn 失败。
    ExitReason run() {
        ExitReason reason = ExitReason::kEndOfCommands;
        for (;;) {
            std::string command;
            try {
                command = commands_->take();
            } catch (const ChannelClosed&) {
                logger_->log(LogLevel::Info, "command source closed, producer loop exiting",
                             {{"loop", opts_.name}, {"commands", std::to_string(commands_processed())}});
                break;
            } catch (const std::exception& e) {
                logger_->log(LogLevel::Info, "command source failed, producer loop exiting",
                             {{"loop", opts_.name},
                              {"commands", std::to_string(commands_processed())},
                              {"err", e.what()}});
                break;
            } catch (...) {
                logger_->log(LogLevel::Info, "command source failed, producer loop exiting",
                             {{"loop", opts_.name},
                              {"commands", std::to_string(commands_processed())},
                              {"err", "unknown exception"}});
                break;
            }

            try {
                produce_fn_(command, *pq_);
            } catch (const std::exception& e) {
                logger_->log(LogLevel::Warn, "produce function failed, producer loop exiting",
                             {{"loop", opts_.name}, {"command", command}, {"err", e.what()}});
                reason = ExitReason::kProductionFailed;
                break;
            } catch (...) {
                logger_->log(LogLevel::Warn, "produce function failed, producer loop exiting",
                             {{"loop", opts_.name}, {"command", command}, {"err", "unknown exception"}});
                reason = ExitReason::kProductionFailed;
                break;
            }
            processed_.fetch_add(1, std::memory_order_relaxed);
            if (has_metrics_sink()) {
                metrics().counter_add("poolq.command_loop.commands", 1, {{"loop", opts_.name}});
            }
        }
        finish(reason);
        return reason;
    }

    // 在独立 worker 线程上执行 run()；已启动过则返回 false。
    bool start() {
        bool expected = false;
        if (!started_.compare_exchange_strong(expected, true)) return false;
        std::lock_guard<std::mutex> lk(worker_mu_);
        worker_ = std::thread([this]() { run(); });
        return true;
    }

    void join() {
        std::lock_guard<std::mutex> lk(worker_mu_);
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

    bool running() const { return started_.load() && !finished_.load(); }
    std::uint64_t commands_processed() const { return processed_.load(std::memory_order_relaxed); }
    ExitReason exit_reason() const { return exit_reason_.load(); }

private:
    void finish(ExitReason reason) {
        if (opts_.auto_close) {
            pq_->queue()->seal();
            commands_->close();
        }
        exit_reason_.store(reason);
        finished_.store(true);

        const char* why = reason == ExitReason::kProductionFailed ? "production_failed" : "end_of_commands";
        if (has_trace_hook()) {
            trace().event("poolq.command_loop.exit", {{"loop", opts_.name}, {"reason", why}});
        }
        if (has_metrics_sink()) {
            metrics().counter_add("poolq.command_loop.exit", 1, {{"loop", opts_.name}, {"reason", why}});
        }
    }

    CommandSource commands_;
    PoolQueue<T>* pq_;
    ProduceFn produce_fn_;
    CommandLoopOptions opts_;
    const Logger* logger_;

    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    std::atomic<std::uint64_t> processed_{0};
    std::atomic<ExitReason> exit_reason_{ExitReason::kNotRun};
    std::mutex worker_mu_;
    std::thread worker_;
};

} // namespace poolq::core
