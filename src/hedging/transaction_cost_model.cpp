#include "hedging/transaction_cost_model.hpp"

#include <cmath>
#include <sstream>

namespace fxhedge {
namespace hedging {

TransactionCostConfig TransactionCostConfig::default_config() {
    TransactionCostConfig cfg;
    cfg.fixed_fee = 50.0;
    cfg.variable_bps = 2.0;
    return cfg;
}

TransactionCostConfig TransactionCostConfig::from_json(const nlohmann::json& j) {
    TransactionCostConfig cfg = default_config();
    if (j.is_object()) {
        cfg.fixed_fee = j.value("fixed_fee", cfg.fixed_fee);
        cfg.variable_bps = j.value("variable_bps", cfg.variable_bps);
    }
    return cfg;
}

TransactionCostModel::TransactionCostModel(const TransactionCostConfig& config)
    : config_(config) {
    validate_config();
}

TransactionCostModel::TransactionCostModel()
    : config_(TransactionCostConfig::default_config()) {
}

void TransactionCostModel::validate_config() const {
    if (config_.fixed_fee < 0.0) {
        std::ostringstream ss; ss << config_.fixed_fee;
        throw std::invalid_argument("Expected non-negative value for parameter 'fixed_fee', got: " + ss.str());
    }
    if (config_.variable_bps < 0.0) {
        std::ostringstream ss; ss << config_.variable_bps;
        throw std::invalid_argument("Expected non-negative value for parameter 'variable_bps', got: " + ss.str());
    }
}

HedgeTradeCost TransactionCostModel::calculate_cost(const HedgeOrder& order) const {
    if (!std::isfinite(order.notional)) {
        throw std::invalid_argument("Expected finite notional for order on " + order.currency);
    }
    if (order.instrument == "natural" || order.notional == 0.0) {
        return HedgeTradeCost{};
    }
    return HedgeTradeCost{config_.fixed_fee, variable_cost(order.notional)};
}

double TransactionCostModel::calculate_total_cost(const std::vector<HedgeOrder>& orders) const {
    double sum = 0.0;
    for (const auto& o : orders) {
        sum += calculate_cost(o).total();
    }
    return sum;
}

double TransactionCostModel::variable_cost(double notional) const {
    return std::abs(notional) * (config_.variable_bps / 10000.0);
}

} // namespace hedging
} // namespace fxhedge
