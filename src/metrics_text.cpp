#include "metrics_text.h"

#include <sstream>

namespace poolq::core {

namespace {

// 指标名只保留 [a-zA-Z0-9_:]，其余字符替换为 '_'。
std::string metric_name(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 1);
    for (char c : in) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == ':';
        out.push_back(ok ? c : '_');
    }
    if (out.empty()) return "poolq_metric";
    if (out[0] >= '0' && out[0] <= '9') out.insert(out.begin(), '_');
    return out;
}

void append_label_value(std::string& out, std::string_view v) {
    for (char c : v) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '"') {
            out += "\\\"";
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out.push_back(c);
        }
    }
}

} // namespace

TextMetricsSink::SeriesKey TextMetricsSink::series_key(std::string_view name,
                                                      std::initializer_list<LabelView> labels) {
    std::string rendered;
    for (const auto& l : labels) {
        if (l.key.empty()) continue;
        rendered += rendered.empty() ? "{" : ",";
        rendered.append(l.key.data(), l.key.size());
        rendered += "=\"";
        append_label_value(rendered, l.value);
        rendered += '"';
    }
    if (!rendered.empty()) rendered += '}';
    return {metric_name(name), std::move(rendered)};
}

void TextMetricsSink::counter_add(std::string_view name, double value, std::initializer_list<LabelView> labels) noexcept {
    SeriesKey key = series_key(name, labels);
    std::lock_guard<std::mutex> lk(mu_);
    counters_[key] += value;
}

void TextMetricsSink::gauge_set(std::string_view name, double value, std::initializer_list<LabelView> labels) noexcept {
    SeriesKey key = series_key(name, labels);
    std::lock_guard<std::mutex> lk(mu_);
    gauges_[key] = value;
}

double TextMetricsSink::value(const std::string& series) const {
    const auto brace = series.find('{');
    const SeriesKey key{series.substr(0, brace), brace == std::string::npos ? std::string() : series.substr(brace)};
    std::lock_guard<std::mutex> lk(mu_);
    if (auto it = counters_.find(key); it != counters_.end()) return it->second;
    if (auto it = gauges_.find(key); it != gauges_.end()) return it->second;
    return 0.0;
}

std::string TextMetricsSink::render() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream out;
    auto emit = [&out](const std::map<SeriesKey, double>& series, const char* type) {
        const std::string* family = nullptr;
        for (const auto& [key, v] : series) {
            if (!family || *family != key.first) {
                family = &key.first;
                out << "# TYPE " << key.first << ' ' << type << '\n';
            }
            out << key.first << key.second << ' ' << v << '\n';
        }
    };
    emit(counters_, "counter");
    emit(gauges_, "gauge");
    return out.str();
}

} // namespace poolq::core
