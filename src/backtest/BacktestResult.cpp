#include "backtest/BacktestResult.h"

namespace exitforge {
namespace backtest {

namespace {
nlohmann::json intervalJson(const analytics::ConfidenceInterval& ci) {
    return nlohmann::json::array({ci.lower, ci.upper});
}
}

nlohmann::json toJson(const TradeRecord& trade) {
    nlohmann::json j;
    j["instrument"] = trade.instrument;
    j["entry_time"] = trade.entry_time;
    j["exit_time"] = trade.exit_time;
    j["entry_price"] = trade.entry_price;
    j["exit_price"] = trade.exit_price;
    j["pnl_pct"] = trade.pnl_pct;
    j["pnl_net"] = trade.pnl_net;
    j["log_return"] = trade.log_return;
    j["exit_reason"] = risk::toString(trade.exit_reason);
    j["hold_candles"] = trade.hold_candles;
    j["high_water_mark_pct"] = trade.high_water_mark_pct;
    j["low_water_mark_pct"] = trade.low_water_mark_pct;
    j["max_drawdown_pct"] = trade.max_drawdown_pct;
    return j;
}

nlohmann::json toJson(const BacktestResult& result) {
    nlohmann::json j;
    j["strategy_id"] = result.strategy_id;
    j["exit_policy"] = strategy::toJson(result.exit_policy);
    j["total_trades"] = result.total_trades;
    j["wins"] = result.wins;
    j["losses"] = result.losses;
    j["win_rate"] = result.win_rate;
    j["win_rate_display"] = result.win_rate_display;
    j["profit_factor"] = result.profit_factor;
    j["gross_win"] = result.gross_win;
    j["gross_loss"] = result.gross_loss;
    j["expectancy"] = result.expectancy;
    j["best_trade"] = result.best_trade;
    j["worst_trade"] = result.worst_trade;
    j["max_drawdown_pct"] = result.max_drawdown_pct;
    j["sharpe_like"] = result.sharpe_like;
    j["avg_hold_candles"] = result.avg_hold_candles;
    j["win_rate_ci95"] = intervalJson(result.win_rate_ci95);
    j["avg_return_ci95"] = intervalJson(result.avg_return_ci95);
    j["sharpe_ci95"] = intervalJson(result.sharpe_ci95);
    j["clt_reliable"] = result.clt_reliable;
    j["ewma_volatility"] = result.ewma_volatility;
    j["log_return_std"] = result.log_return_std;
    j["volatility_ratio"] = result.volatility_ratio;
    j["volatility_regime_shift"] = result.volatility_regime_shift;
    j["equity_curve"] = result.equity_curve;
    j["exit_reason_counts"] = result.exit_reason_counts;
    j["insufficient_instruments"] = result.insufficient_instruments;
    j["instruments"] = result.instruments;
    j["data_start"] = result.data_start;
    j["data_end"] = result.data_end;
    return j;
}

} // namespace backtest
} // namespace exitforge
