#include "risk/RiskTriggerEngine.h"
#include "common/Logger.h"

#include <algorithm>
#include <type_traits>

namespace exitforge {
namespace risk {

namespace {
constexpr long long kIdlePollMs = 200;
}

RiskTriggerEngine::RiskTriggerEngine(std::shared_ptr<network::FallbackPriceSource> prices,
                                     RiskEngineSettings settings,
                                     Clock clock)
    : prices_(std::move(prices))
    , settings_(std::move(settings))
    , clock_(std::move(clock))
    , evaluator_(settings_.debounce_ms)
    , interval_ms_(settings_.interval_ms) {
    current_delay_ms_ = interval_ms_;
}

RiskTriggerEngine::~RiskTriggerEngine() {
    shutdown();
}

long long RiskTriggerEngine::nowMs() const {
    if (clock_) {
        return clock_();
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

bool RiskTriggerEngine::start() {
    if (running_) {
        LOG_WARN("Risk engine already running");
        return false;
    }
    if (!prices_) {
        LOG_ERROR("Risk engine has no price source");
        return false;
    }

    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&RiskTriggerEngine::run, this);
    LOG_INFO("Risk engine started (interval {} ms, debounce {} ms)",
             settings_.interval_ms, settings_.debounce_ms);
    return true;
}

void RiskTriggerEngine::shutdown() {
    if (!running_ && !worker_thread_) {
        return;
    }

    running_ = false;
    inbox_.close();

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();
    outbox_.close();
    LOG_INFO("Risk engine stopped");
}

bool RiskTriggerEngine::send(RiskInbound message) {
    return inbox_.push(std::move(message));
}

std::optional<RiskOutbound> RiskTriggerEngine::receive(std::chrono::milliseconds timeout) {
    return outbox_.pop(timeout);
}

void RiskTriggerEngine::run() {
    auto next_tick = std::chrono::steady_clock::now();

    while (running_) {
        auto wait = std::chrono::milliseconds(kIdlePollMs);
        if (ticking_) {
            const auto now = std::chrono::steady_clock::now();
            wait = (next_tick > now)
                ? std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - now)
                : std::chrono::milliseconds(0);
        }

        auto message = inbox_.pop(wait);
        if (message) {
            handle(*message);
            // Drain whatever else queued up so the tick sees the latest set
            while (auto more = inbox_.tryPop()) {
                handle(*more);
            }
        }

        if (!running_) {
            break;
        }

        if (ticking_ && (tick_now_ || std::chrono::steady_clock::now() >= next_tick)) {
            tick_now_ = false;
            tick();
            next_tick = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(current_delay_ms_.load());
        }
    }
}

void RiskTriggerEngine::handle(const RiskInbound& message) {
    std::visit([this](const auto& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, SyncCommand>) {
            evaluator_.sync(cmd.positions);
            tracked_ = evaluator_.size();
            if (cmd.interval_ms > 0) {
                // Never poll slower than the backoff ceiling
                interval_ms_ = std::min(cmd.interval_ms, settings_.max_backoff_ms);
            }
            consecutive_failures_ = 0;
            current_delay_ms_ = interval_ms_;
            ticking_ = true;
            tick_now_ = true;
            LOG_INFO("SYNC: tracking {} positions, interval {} ms", evaluator_.size(), interval_ms_);
        } else {
            evaluator_.clear();
            tracked_ = 0;
            ticking_ = false;
            tick_now_ = false;
            consecutive_failures_ = 0;
            current_delay_ms_ = interval_ms_;
            LOG_INFO("STOP: cleared tracked positions");
        }
    }, message);
}

void RiskTriggerEngine::tick() {
    const auto instruments = evaluator_.instruments();
    if (instruments.empty()) {
        return;
    }

    const network::PriceBatch batch = prices_->fetch(instruments);
    const long long now = nowMs();

    if (batch.all_failed) {
        const int failures = ++consecutive_failures_;
        long long delay = interval_ms_;
        for (int k = 0; k < failures && delay < settings_.max_backoff_ms; ++k) {
            delay *= 2;
        }
        current_delay_ms_ = std::min(settings_.max_backoff_ms, delay);
        LOG_WARN("Price fetch failed for all {} instruments ({} in a row), next tick in {} ms",
                 instruments.size(), failures, current_delay_ms_.load());
        return;
    }

    consecutive_failures_ = 0;
    current_delay_ms_ = interval_ms_;

    EvaluationResult result = evaluator_.evaluate(batch.prices, now);

    if (!result.updates.empty()) {
        PriceUpdateMessage update;
        update.updates = std::move(result.updates);
        update.ts_ms = now;
        // Each update carries every tracked position, so an unread older one is stale
        outbox_.pushReplacing(std::move(update), [](const RiskOutbound& queued) {
            return std::holds_alternative<PriceUpdateMessage>(queued);
        });
    }

    for (const auto& trigger : result.triggers) {
        Logger::getInstance().logTrigger(trigger.position_id, trigger.instrument, trigger.kindName(),
                                         trigger.pnl_pct, trigger.price, trigger.high_water_mark_pct);
        LOG_WARN("TRIGGER {} {} ({}) pnl {:.2f}% hwm {:.2f}% @ {}",
                 trigger.kindName(), trigger.position_id, trigger.instrument,
                 trigger.pnl_pct, trigger.high_water_mark_pct, trigger.price);
        outbox_.push(trigger);
    }
}

} // namespace risk
} // namespace exitforge
