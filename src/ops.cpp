#include "kernel/ops.hpp"
#include "kernel/param_utils.hpp"

#include <deque>
#include <map>
#include <string>
#include <utility>

namespace tg { namespace ops {

namespace {

bool is_absent(const Value& v) {
    return !v || v.IsNull();
}

double as_number(const Value& v, const std::string& what) {
    if (!v.IsScalar()) {
        throw GraphError(GraphErrc::InvalidParameter, what + " is not a number");
    }
    return v.as<double>();
}

const Value& source_or_throw(const SourceValues& sources, const std::string& label) {
    auto it = sources.find(label);
    if (it == sources.end()) {
        throw GraphError(GraphErrc::InvalidParameter, "missing source '" + label + "'");
    }
    return it->second;
}

// timestamp -> (original key node, value), ordered by timestamp
using Series = std::map<double, std::pair<Value, Value>>;

Series read_series(const Value& v, const std::string& what) {
    Series out;
    if (is_absent(v)) return out;
    if (!v.IsMap()) {
        throw GraphError(GraphErrc::InvalidParameter,
                         what + " is not a map of timestamp -> value");
    }
    for (auto it = v.begin(); it != v.end(); ++it) {
        out[as_number(it->first, what + " timestamp")] = {it->first, it->second};
    }
    return out;
}

Value write_series(const Series& series) {
    Value out(YAML::NodeType::Map);
    for (const auto& [ts, entry] : series) {
        out.force_insert(entry.first, entry.second);
    }
    return out;
}

// =============================================================================
// ==                              stateless ops                              ==
// =============================================================================

Handler make_relay(const YAML::Node&) {
    return [](const Value&, const SourceValues& sources) -> Value {
        return sources.begin()->second;
    };
}

Handler make_add(const YAML::Node&) {
    return [](const Value&, const SourceValues& sources) -> Value {
        bool any = false;
        double sum = 0.0;
        for (const auto& [label, v] : sources) {
            if (is_absent(v)) continue;
            sum += as_number(v, "source '" + label + "'");
            any = true;
        }
        return any ? Value(sum) : Value();
    };
}

Handler make_mean(const YAML::Node&) {
    return [](const Value&, const SourceValues& sources) -> Value {
        const Value& series = source_or_throw(sources, "source");
        if (is_absent(series) || !series.IsSequence() || series.size() == 0) {
            return Value();
        }
        double sum = 0.0;
        for (const auto& item : series) {
            sum += as_number(item, "series item");
        }
        return Value(sum / static_cast<double>(series.size()));
    };
}

// =============================================================================
// ==                              stateful ops                               ==
// =============================================================================

Handler make_accumulate(const YAML::Node&) {
    return [](const Value& previous, const SourceValues& sources) -> Value {
        const Value& input = source_or_throw(sources, "input");
        if (is_absent(input)) return previous;
        double base = is_absent(previous) ? 0.0 : as_number(previous, "previous value");
        return Value(base + as_number(input, "input"));
    };
}

Handler make_count(const YAML::Node&) {
    return [](const Value& previous, const SourceValues& sources) -> Value {
        long long count = is_absent(previous) ? 0 : previous.as<long long>();
        if (!is_absent(source_or_throw(sources, "input"))) ++count;
        return Value(count);
    };
}

Handler make_latest_n(const YAML::Node& params) {
    const int n = require_positive_int(params, "n", "stream:latest_n");
    return [n](const Value& previous, const SourceValues& sources) -> Value {
        std::deque<Value> items;
        if (!is_absent(previous) && previous.IsSequence()) {
            for (const auto& item : previous) items.push_back(item);
        }
        const Value& input = source_or_throw(sources, "input");
        if (!is_absent(input)) items.push_back(YAML::Clone(input));
        while (items.size() > static_cast<size_t>(n)) items.pop_front();

        Value out(YAML::NodeType::Sequence);
        for (const auto& item : items) out.push_back(item);
        return out;
    };
}

// Merges each input map into the stored series and keeps the newest
// `max_size` timestamps.
Handler make_timeseries(const YAML::Node& params) {
    const int max_size = require_positive_int(params, "max_size", "stream:timeseries");
    return [max_size](const Value& previous, const SourceValues& sources) -> Value {
        Series series = read_series(previous, "previous value");
        for (auto& [ts, entry] : read_series(source_or_throw(sources, "input"), "input")) {
            series[ts] = std::move(entry);
        }
        while (series.size() > static_cast<size_t>(max_size)) {
            series.erase(series.begin());
        }
        return write_series(series);
    };
}

// For every timestamp in `input`, averages the last `period` values of
// the `source` series up to that timestamp. Timestamps with fewer than
// `period` values so far get no entry.
Handler make_moving_average(const YAML::Node& params) {
    const int period = require_positive_int(params, "period", "stream:moving_average");
    return [period](const Value& previous, const SourceValues& sources) -> Value {
        Series averages = read_series(previous, "previous value");
        const Series input = read_series(source_or_throw(sources, "input"), "input");
        const Series source = read_series(source_or_throw(sources, "source"), "source");
        for (const auto& [ts, entry] : input) {
            int count = 0;
            double sum = 0.0;
            for (auto it = source.upper_bound(ts); it != source.begin() && count < period;) {
                --it;
                sum += as_number(it->second.second, "source value");
                ++count;
            }
            if (count == period) {
                averages[ts] = {entry.first, Value(sum / count)};
            }
        }
        return write_series(averages);
    };
}

} // namespace

void register_builtin() {
    auto& R = OpRegistry::instance();

    R.register_op("flow", "relay", HandlerFactory(make_relay));
    R.register_op("math", "add", HandlerFactory(make_add));
    R.register_op("math", "mean", HandlerFactory(make_mean));

    R.register_op("state", "accumulate", HandlerFactory(make_accumulate));
    R.register_op("stream", "count", HandlerFactory(make_count));
    R.register_op("stream", "latest_n", HandlerFactory(make_latest_n));
    R.register_op("stream", "timeseries", HandlerFactory(make_timeseries));
    R.register_op("stream", "moving_average", HandlerFactory(make_moving_average));
}

}} // namespace tg::ops
