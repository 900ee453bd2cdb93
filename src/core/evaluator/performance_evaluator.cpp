#include <profitguardian/core/evaluator/performance_evaluator.hpp>
#include <profitguardian/core/utils/clock.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ProfitGuardian {

PerformanceEvaluator::PerformanceEvaluator(const AppConfig::EvaluatorThresholds& thresholds)
    : thresholds_(thresholds) {
    spdlog::debug("[Evaluator] min_clicks={} breakeven={} over_pace={} history={} ticks/{}h",
                  thresholds_.min_clicks, thresholds_.breakeven_cost, thresholds_.over_pace_ratio,
                  thresholds_.history_ticks, thresholds_.history_window_hours);
}

PacingState PerformanceEvaluator::computePacing(const ManagedEntity& entity,
                                                const MetricsSnapshot& current) const {
    PacingState pacing;
    const double elapsed = std::clamp(current.elapsed_day_fraction, 0.0, 1.0);
    pacing.target_by_now = entity.daily_budget * elapsed;
    pacing.actual_spend = current.spend;

    // No budget or day not started: no signal yet, never a zero ratio
    if (pacing.target_by_now <= 0.0) {
        pacing.pacing = PacingClass::NO_SIGNAL;
        return pacing;
    }

    const double ratio = pacing.actual_spend / pacing.target_by_now;
    pacing.ratio = ratio;
    if (ratio > thresholds_.over_pace_ratio) {
        pacing.pacing = PacingClass::OVER_PACE;
    } else if (ratio < thresholds_.under_pace_ratio) {
        pacing.pacing = PacingClass::UNDER_PACE;
    } else {
        pacing.pacing = PacingClass::ON_PACE;
    }
    return pacing;
}

IntervalActivity PerformanceEvaluator::intervalDelta(const MetricsSnapshot* previous,
                                                     const MetricsSnapshot& current) {
    IntervalActivity a;
    const bool rollover = previous == nullptr
        || current.spend < previous->spend
        || current.clicks < previous->clicks
        || current.impressions < previous->impressions;

    if (rollover) {
        a.spend = current.spend;
        a.conversions = current.conversions;
        a.clicks = current.clicks;
        a.impressions = current.impressions;
        a.has_value = current.conversion_value.has_value();
        a.value = current.conversion_value.value_or(0.0);
        return a;
    }

    a.spend = current.spend - previous->spend;
    a.conversions = std::max(0.0, current.conversions - previous->conversions);
    a.clicks = current.clicks - previous->clicks;
    a.impressions = current.impressions - previous->impressions;
    a.has_value = current.conversion_value.has_value() && previous->conversion_value.has_value();
    if (a.has_value) {
        a.value = std::max(0.0, *current.conversion_value - *previous->conversion_value);
    }
    return a;
}

double PerformanceEvaluator::attributedValue(const IntervalActivity& activity) const {
    if (activity.has_value) {
        return activity.value;
    }
    return activity.conversions * thresholds_.breakeven_cost;
}

Confidence PerformanceEvaluator::classifyConfidence(uint64_t clicks, uint64_t impressions) const {
    if (clicks < thresholds_.min_clicks || impressions < thresholds_.min_impressions) {
        return Confidence::LOW;
    }
    const double high = static_cast<double>(thresholds_.min_clicks) * thresholds_.high_confidence_multiplier;
    if (static_cast<double>(clicks) < high) {
        return Confidence::MEDIUM;
    }
    return Confidence::HIGH;
}

ProfitabilitySignal PerformanceEvaluator::computeSignal(const MetricsSnapshot& current,
                                                        const std::vector<MetricsSnapshot>& history) const {
    // Window: last history_ticks snapshots (current included) no older than history_window_hours
    const uint64_t window_ms = static_cast<uint64_t>(thresholds_.history_window_hours * MS_PER_HOUR);
    const uint64_t oldest_allowed = current.timestamp_ms > window_ms ? current.timestamp_ms - window_ms : 0;

    std::vector<const MetricsSnapshot*> chain;
    chain.reserve(history.size() + 1);
    for (const auto& snap : history) {
        if (snap.timestamp_ms < current.timestamp_ms) {
            chain.push_back(&snap);
        }
    }
    chain.push_back(&current);

    const size_t max_ticks = thresholds_.history_ticks;
    size_t first = chain.size() > max_ticks ? chain.size() - max_ticks : 0;
    while (first < chain.size() - 1 && chain[first]->timestamp_ms < oldest_allowed) {
        ++first;
    }

    ProfitabilitySignal signal;
    bool all_valued = true;
    for (size_t i = first; i < chain.size(); ++i) {
        const MetricsSnapshot* prev = i > 0 ? chain[i - 1] : nullptr;
        // A predecessor older than the window would fold stale activity in
        if (prev != nullptr && prev->timestamp_ms + window_ms < chain[i]->timestamp_ms) {
            prev = nullptr;
        }
        const IntervalActivity a = intervalDelta(prev, *chain[i]);
        signal.window_spend += a.spend;
        signal.window_conversions += a.conversions;
        signal.window_clicks += a.clicks;
        signal.window_impressions += a.impressions;
        signal.window_value += a.value;
        all_valued = all_valued && a.has_value;
        ++signal.window_ticks;
    }

    signal.confidence = classifyConfidence(signal.window_clicks, signal.window_impressions);

    if (signal.window_spend <= 0.0 && signal.window_clicks == 0) {
        signal.basis = all_valued ? SignalBasis::VALUE : SignalBasis::PROXY;
        signal.polarity = Polarity::NEUTRAL;
        signal.profit = 0.0;
        return signal;
    }

    if (all_valued) {
        signal.basis = SignalBasis::VALUE;
        signal.profit = signal.window_value - signal.window_spend;
    } else {
        signal.basis = SignalBasis::PROXY;
        signal.window_value = signal.window_conversions * thresholds_.breakeven_cost;
        signal.profit = signal.window_value - signal.window_spend;

        // Without a conversion, spend below one breakeven cost proves nothing yet
        if (signal.window_conversions <= 0.0 && signal.window_spend <= thresholds_.breakeven_cost) {
            signal.polarity = Polarity::NEUTRAL;
            return signal;
        }
    }

    if (signal.profit < -thresholds_.profit_tolerance) {
        signal.polarity = Polarity::NEGATIVE;
    } else if (signal.profit > thresholds_.profit_tolerance) {
        signal.polarity = Polarity::POSITIVE;
    } else {
        signal.polarity = Polarity::NEUTRAL;
    }
    return signal;
}

EntityEvaluation PerformanceEvaluator::evaluate(const ManagedEntity& entity,
                                                const MetricsSnapshot& current,
                                                const std::vector<MetricsSnapshot>& history) const {
    EntityEvaluation ev;
    ev.entity_id = entity.id;
    ev.pacing = computePacing(entity, current);
    ev.signal = computeSignal(current, history);

    spdlog::debug("[Evaluator] {} ({}) pace={} ratio={} profit={:.2f} {} {} conf={}",
                  entity.id, kindString(entity.kind()), pacingString(ev.pacing.pacing),
                  ev.pacing.ratio ? *ev.pacing.ratio : 0.0, ev.signal.profit,
                  basisString(ev.signal.basis), polarityString(ev.signal.polarity),
                  confidenceString(ev.signal.confidence));
    return ev;
}

} // namespace ProfitGuardian
