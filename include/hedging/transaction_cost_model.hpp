// transaction_cost_model.hpp
#pragma once

#include <cmath>
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fxhedge {
namespace hedging {

struct HedgeOrder {
    std::string instrument;
    std::string currency;
    double notional{0.0};
};

struct HedgeTradeCost {
    double fixed_fee{0.0};
    double variable_fee{0.0};
    double total() const { return fixed_fee + variable_fee; }
};

struct TransactionCostConfig {
    double fixed_fee{50.0};
    double variable_bps{2.0};

    static TransactionCostConfig from_json(const nlohmann::json& j);
    static TransactionCostConfig default_config();
};

// Execution cost of booking hedge legs: a fixed ticket fee plus a
// basis-point fee on notional. Natural hedges book nothing.
class TransactionCostModel {
public:
    explicit TransactionCostModel(const TransactionCostConfig& config);
    TransactionCostModel();
    ~TransactionCostModel() = default;

    HedgeTradeCost calculate_cost(const HedgeOrder& order) const;
    double calculate_total_cost(const std::vector<HedgeOrder>& orders) const;

    const TransactionCostConfig& config() const { return config_; }
    std::string get_name() const { return "TransactionCostModel"; }

    double variable_cost(double notional) const;

private:
    TransactionCostConfig config_;
    void validate_config() const;
};

} // namespace hedging
} // namespace fxhedge
