#pragma once

#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "observability.h"

namespace poolq::core {

// 进程内聚合的 metrics sink，按 Prometheus 文本格式输出。
// 同名同标签的 counter 累加、gauge 覆盖；输出按 name + labels 排序。
class TextMetricsSink final : public MetricsSink {
public:
    TextMetricsSink() = default;

    TextMetricsSink(const TextMetricsSink&) = delete;
    TextMetricsSink& operator=(const TextMetricsSink&) = delete;

    void counter_add(std::string_view name, double value, std::initializer_list<LabelView> labels) noexcept override;
    void gauge_set(std::string_view name, double value, std::initializer_list<LabelView> labels) noexcept override;

    // 单个序列的当前值；series 形如 poolq_channel_put{channel="pool"}，不存在时返回 0。
    double value(const std::string& series) const;

    std::string render() const;

private:
    // (指标名, 渲染后的标签)；按指标名聚在一起，保证每个 family 只输出一次 TYPE 行。
    using SeriesKey = std::pair<std::string, std::string>;

    static SeriesKey series_key(std::string_view name, std::initializer_list<LabelView> labels);

    mutable std::mutex mu_;
    std::map<SeriesKey, double> counters_;
    std::map<SeriesKey, double> gauges_;
};

} // namespace poolq::core
