#pragma once

#include <initializer_list>
#include <string_view>

namespace poolq::core {

struct LabelView {
    std::string_view key;
    std::string_view value;
};

// 结构化事件 hook：command loop 退出等生命周期事件。实现应保证不抛异常。
class TraceHook {
public:
    virtual ~TraceHook() = default;
    virtual void event(std::string_view name, std::initializer_list<LabelView> fields) noexcept = 0;
};

// 最小化 metrics 抽象：channel put/take/closed 计数与深度 gauge。实现应保证不抛异常。
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void counter_add(std::string_view name,
                             double value,
                             std::initializer_list<LabelView> labels) noexcept = 0;

    virtual void gauge_set(std::string_view name,
                           double value,
                           std::initializer_list<LabelView> labels) noexcept = 0;
};

// 全局 hook（进程级）。所有权由调用方保留；hook 的生命周期必须覆盖其注册期。
// 传入 nullptr 恢复为 no-op。
void set_trace_hook(TraceHook* hook) noexcept;
void set_metrics_sink(MetricsSink* sink) noexcept;

TraceHook& trace() noexcept;
MetricsSink& metrics() noexcept;

bool has_trace_hook() noexcept;
bool has_metrics_sink() noexcept;

// RAII：作用域内安装 sink，析构时恢复为 no-op。
class ScopedMetricsSink {
public:
    explicit ScopedMetricsSink(MetricsSink& sink) noexcept { set_metrics_sink(&sink); }
    ScopedMetricsSink(const ScopedMetricsSink&) = delete;
    ScopedMetricsSink& operator=(const ScopedMetricsSink&) = delete;
    ~ScopedMetricsSink() { set_metrics_sink(nullptr); }
};

class ScopedTraceHook {
public:
    explicit ScopedTraceHook(TraceHook& hook) noexcept { set_trace_hook(&hook); }
    ScopedTraceHook(const ScopedTraceHook&) = delete;
    ScopedTraceHook& operator=(const ScopedTraceHook&) = delete;
    ~ScopedTraceHook() { set_trace_hook(nullptr); }
};

} // namespace poolq::core
