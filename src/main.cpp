/**
 * @file main.cpp
 * @brief Main entry point for the FX Hedge Optimizer
 *
 * Command-line application that loads a portfolio and market data, runs the
 * currency risk assessment, optimizes hedging strategies, and writes results.
 */

#include "common/time_utils.hpp"
#include "data/data_loader.hpp"
#include "data/market_data_provider.hpp"
#include "hedging/hedging_strategy_optimizer.hpp"
#include "risk/currency_risk_engine.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

using namespace fxhedge;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "FX Hedge Optimizer v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --portfolio PATH      Path to portfolio JSON file (required)\n"
              << "  --config PATH         Path to engine configuration JSON (default: built-in)\n"
              << "  --rates PATH          Path to spot-rate JSON table\n"
              << "  --prices PATH         Path to FX history CSV (default: synthetic history)\n"
              << "  --user ID             User identifier (default: cli-user)\n"
              << "  --output PATH         Path to output directory (default: results)\n"
              << "  --seed N              Fix the random seed for Monte Carlo and synthetic data\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --portfolio data/portfolio/sample_portfolio.json"
              << " --config data/config/engine_config.json --rates data/market/rates.json --seed 42\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       FX Hedge Optimizer v1.0.0                               \n"
              << "       Currency Risk Assessment and Hedge Optimization         \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string portfolio_path;
    std::string rates_path;
    std::string prices_path;
    std::string user_id = "cli-user";
    std::string output_dir = "results";
    std::optional<std::uint64_t> seed;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--portfolio" && i + 1 < argc)
            {
                args.portfolio_path = argv[++i];
            }
            else if (arg == "--rates" && i + 1 < argc)
            {
                args.rates_path = argv[++i];
            }
            else if (arg == "--prices" && i + 1 < argc)
            {
                args.prices_path = argv[++i];
            }
            else if (arg == "--user" && i + 1 < argc)
            {
                args.user_id = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--seed" && i + 1 < argc)
            {
                args.seed = std::stoull(argv[++i]);
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !portfolio_path.empty();
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration and Portfolio
        // ====================================================================
        std::cout << "[1/5] Loading configuration and portfolio..." << std::endl;

        auto config = args.config_path.empty()
                          ? config::EngineConfig::default_config()
                          : data::DataLoader::load_config(args.config_path);
        if (args.seed)
        {
            config.risk.random_seed = args.seed;
        }
        config.validate();

        auto portfolio = data::DataLoader::load_portfolio(args.portfolio_path);

        std::cout << "  - Base currency: " << portfolio.base_currency
                  << ", " << portfolio.accounts.size() << " accounts\n";
        if (args.verbose)
        {
            std::cout << "  - Lookback window: " << config.risk.lookback_window
                      << " (" << config.risk.active_lookback() << " days)\n";
            std::cout << "  - Monte Carlo: " << config.risk.monte_carlo_trials << " trials in "
                      << config.risk.monte_carlo_batches << " batches\n";
            std::cout << "  - Pricing model: " << config.pricing_model << "\n";
            std::cout << "  - Instruments: " << config.instruments.size() << "\n";
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/5] Loading market data..." << std::endl;

        data::MarketData history;
        if (!args.prices_path.empty())
        {
            history = data::DataLoader::load_csv_wide(args.prices_path, portfolio.base_currency);
        }
        else
        {
            std::cout << "  - No price file given, generating synthetic history\n";
            history = data::DataLoader::generate_synthetic_fx_history(
                data::DataLoader::default_synthetic_specs(),
                static_cast<size_t>(config.risk.long_lookback) + 1,
                common::add_days(common::today(), -(config.risk.long_lookback + 1)),
                portfolio.base_currency,
                config.risk.random_seed);
        }

        data::InMemoryMarketDataProvider provider(history);
        if (!args.rates_path.empty())
        {
            size_t loaded = data::DataLoader::load_rates(args.rates_path, provider);
            std::cout << "  - Loaded " << loaded << " spot rates\n";
        }
        std::cout << "  - History: " << history.num_dates() << " dates, "
                  << history.num_currencies() << " currencies\n";

        if (args.verbose)
        {
            history.print_summary();
        }

        // ====================================================================
        // 3. Currency Risk Assessment
        // ====================================================================
        std::cout << "[3/5] Assessing currency risk..." << std::endl;

        risk::CurrencyRiskEngine engine(provider, config);
        auto assessment = engine.calculate_currency_risk(args.user_id, portfolio);

        assessment->print_summary();

        // ====================================================================
        // 4. Hedging Strategy Optimization
        // ====================================================================
        std::cout << "[4/5] Optimizing hedging strategies..." << std::endl;

        hedging::HedgingStrategyOptimizer strategy_optimizer(config);
        auto recommendation = strategy_optimizer.generate_recommendations(args.user_id, *assessment);

        if (args.verbose)
        {
            std::cout << "  - Pricing provider: " << strategy_optimizer.pricing().get_name() << "\n";
            std::cout << "  - Candidates evaluated: " << recommendation.candidates_evaluated << "\n";
            for (const auto &opt : recommendation.optimizations)
            {
                opt.print_summary();
            }
        }

        recommendation.print_summary();

        // ====================================================================
        // 5. Export Results
        // ====================================================================
        std::cout << "[5/5] Writing results..." << std::endl;

        std::filesystem::create_directories(args.output_dir);
        std::string assessment_file = args.output_dir + "/risk_assessment.json";
        std::string recommendation_file = args.output_dir + "/hedging_recommendation.json";
        data::DataLoader::save_json(assessment->to_json(), assessment_file);
        data::DataLoader::save_json(recommendation.to_json(), recommendation_file);

        std::cout << "  - Risk assessment: " << assessment_file << "\n";
        std::cout << "  - Recommendation:  " << recommendation_file << "\n";

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    CommandLineArgs args;
    try
    {
        args = CommandLineArgs::parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: invalid argument value: " << e.what() << std::endl;
        return 1;
    }

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
