// cpmm-replay
//
// Replays a JSON scenario of ledger and pool operations against an in-memory
// TokenLedger + AmmEngine and prints one JSON result line per step.
//
//   {
//     "time": 1700000000,
//     "steps": [
//       {"op": "mint", "asset": "0xa", "to": "0x1", "amount": "1000"},
//       {"op": "approve", "asset": "0xa", "owner": "0x1", "amount": "1000"},
//       {"op": "add_liquidity", "sender": "0x1", "asset_a": "0xa", "asset_b": "0xb",
//        "amount_a": "1000", "amount_b": "4000", "recipient": "0x1"},
//       {"op": "swap", "sender": "0x2", "path": ["0xa", "0xb"], "amount_in": "100"},
//       {"op": "price", "asset_a": "0xa", "asset_b": "0xb"}
//     ]
//   }

#include "cpmm/amm.hpp"
#include "cpmm/config.hpp"
#include "cpmm/ledger.hpp"
#include "cpmm/log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace cpmm;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string scenario_path;
    bool verbose = false;
    bool events = false;
};

void print_usage(const char* prog) {
    std::cout << "CPMM scenario replay\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Engine/log configuration (JSON)\n"
              << "  -e, --events         Print pool notifications as they are emitted\n"
              << "  -v, --verbose        Debug logging (overrides config)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Step ops:\n"
              << "  mint, approve, balance, add_liquidity, remove_liquidity,\n"
              << "  swap, swap_exact_out, price, reserves, shares\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            opts.config_path = argv[++i];
        } else if (arg == "-e" || arg == "--events") {
            opts.events = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg[0] != '-' && opts.scenario_path.empty()) {
            opts.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (opts.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return opts;
}

//------------------------------------------------------------------------------
// Scenario field helpers
//------------------------------------------------------------------------------

Address address_field(const json& step, const char* key) {
    auto addr = addresses::from_hex(step.at(key).get<std::string>());
    if (!addr) {
        throw std::invalid_argument(std::string("bad address in `") + key + "`");
    }
    return *addr;
}

Asset asset_field(const json& step, const char* key) {
    return Asset{address_field(step, key)};
}

// Amounts may be JSON integers or decimal strings (for values beyond 64 bits)
I128 amount_field(const json& step, const char* key, I128 fallback = 0) {
    if (!step.contains(key)) return fallback;

    const json& v = step.at(key);
    if (v.is_number_unsigned()) return static_cast<I128>(v.get<uint64_t>());
    if (v.is_number_integer()) return static_cast<I128>(v.get<int64_t>());

    auto parsed = amount_from_string(v.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("bad amount in `") + key + "`");
    }
    return *parsed;
}

uint64_t deadline_field(const json& step) {
    return step.value("deadline", std::numeric_limits<uint64_t>::max());
}

std::vector<Asset> path_field(const json& step) {
    std::vector<Asset> path;
    for (const auto& hop : step.at("path")) {
        auto addr = addresses::from_hex(hop.get<std::string>());
        if (!addr) throw std::invalid_argument("bad address in `path`");
        path.emplace_back(*addr);
    }
    return path;
}

//------------------------------------------------------------------------------
// Event printer
//------------------------------------------------------------------------------

class EventPrinter : public IAmmEvents {
public:
    void on_liquidity_added(const LiquidityAdded& e) override {
        std::cout << json{
            {"event", "LiquidityAdded"},
            {"provider", addresses::to_hex(e.provider)},
            {"asset_a", e.asset_a.to_string()},
            {"asset_b", e.asset_b.to_string()},
            {"amount_a", amount_to_string(e.amount_a)},
            {"amount_b", amount_to_string(e.amount_b)},
            {"shares", amount_to_string(e.shares)},
        }.dump() << "\n";
    }

    void on_liquidity_removed(const LiquidityRemoved& e) override {
        std::cout << json{
            {"event", "LiquidityRemoved"},
            {"provider", addresses::to_hex(e.provider)},
            {"asset_a", e.asset_a.to_string()},
            {"asset_b", e.asset_b.to_string()},
            {"amount_a", amount_to_string(e.amount_a)},
            {"amount_b", amount_to_string(e.amount_b)},
            {"shares", amount_to_string(e.shares)},
        }.dump() << "\n";
    }

    void on_tokens_swapped(const TokensSwapped& e) override {
        std::cout << json{
            {"event", "TokensSwapped"},
            {"sender", addresses::to_hex(e.sender)},
            {"asset_in", e.asset_in.to_string()},
            {"asset_out", e.asset_out.to_string()},
            {"amount_in", amount_to_string(e.amount_in)},
            {"amount_out", amount_to_string(e.amount_out)},
        }.dump() << "\n";
    }
};

//------------------------------------------------------------------------------
// Step execution
//------------------------------------------------------------------------------

json run_step(TokenLedger& ledger, AmmEngine& engine, const json& step) {
    const std::string op = step.at("op").get<std::string>();
    json out = {{"op", op}};

    auto set_error = [&](int32_t code) { out["error"] = error_string(code); };

    if (op == "mint") {
        set_error(ledger.mint(asset_field(step, "asset"), address_field(step, "to"),
                              amount_field(step, "amount")));
    } else if (op == "approve") {
        // Spender defaults to the pool custody account
        Address spender = step.contains("spender") ? address_field(step, "spender")
                                                   : engine.custody();
        set_error(ledger.approve(asset_field(step, "asset"), address_field(step, "owner"),
                                 spender, amount_field(step, "amount")));
    } else if (op == "balance") {
        set_error(errors::OK);
        out["balance"] = amount_to_string(
            ledger.balance_of(asset_field(step, "asset"), address_field(step, "owner")));
    } else if (op == "add_liquidity") {
        AddLiquidityParams params{
            asset_field(step, "asset_a"),
            asset_field(step, "asset_b"),
            amount_field(step, "amount_a"),
            amount_field(step, "amount_b"),
            amount_field(step, "min_a"),
            amount_field(step, "min_b"),
            address_field(step, "recipient"),
            deadline_field(step),
        };
        auto r = engine.add_liquidity(address_field(step, "sender"), params);
        set_error(r.error_code);
        out["amount_a"] = amount_to_string(r.amount_a);
        out["amount_b"] = amount_to_string(r.amount_b);
        out["shares"] = amount_to_string(r.shares);
    } else if (op == "remove_liquidity") {
        RemoveLiquidityParams params{
            asset_field(step, "asset_a"),
            asset_field(step, "asset_b"),
            amount_field(step, "shares"),
            amount_field(step, "min_a"),
            amount_field(step, "min_b"),
            address_field(step, "recipient"),
            deadline_field(step),
        };
        auto r = engine.remove_liquidity(address_field(step, "sender"), params);
        set_error(r.error_code);
        out["amount_a"] = amount_to_string(r.amount_a);
        out["amount_b"] = amount_to_string(r.amount_b);
    } else if (op == "swap") {
        Address sender = address_field(step, "sender");
        SwapExactInParams params{
            amount_field(step, "amount_in"),
            amount_field(step, "min_out"),
            path_field(step),
            step.contains("recipient") ? address_field(step, "recipient") : sender,
            deadline_field(step),
        };
        auto r = engine.swap_exact_tokens_for_tokens(sender, params);
        set_error(r.error_code);
        out["amounts"] = json::array();
        for (I128 a : r.amounts) out["amounts"].push_back(amount_to_string(a));
    } else if (op == "swap_exact_out") {
        Address sender = address_field(step, "sender");
        SwapExactOutParams params{
            amount_field(step, "amount_out"),
            amount_field(step, "max_in", MAX_RESERVE),
            path_field(step),
            step.contains("recipient") ? address_field(step, "recipient") : sender,
            deadline_field(step),
        };
        auto r = engine.swap_tokens_for_exact_tokens(sender, params);
        set_error(r.error_code);
        out["amounts"] = json::array();
        for (I128 a : r.amounts) out["amounts"].push_back(amount_to_string(a));
    } else if (op == "price") {
        auto r = engine.get_price(asset_field(step, "asset_a"), asset_field(step, "asset_b"));
        set_error(r.error_code);
        out["price_x18"] = amount_to_string(r.price_x18);
    } else if (op == "reserves") {
        auto r = engine.get_reserves(asset_field(step, "asset_a"), asset_field(step, "asset_b"));
        set_error(r ? errors::OK : errors::PAIR_NOT_FOUND);
        if (r) {
            out["reserve_a"] = amount_to_string(r->reserve_a);
            out["reserve_b"] = amount_to_string(r->reserve_b);
        }
    } else if (op == "shares") {
        set_error(errors::OK);
        out["shares"] = amount_to_string(engine.shares_of(
            asset_field(step, "asset_a"), asset_field(step, "asset_b"),
            address_field(step, "owner")));
    } else {
        throw std::invalid_argument("unknown op `" + op + "`");
    }

    return out;
}

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);

    Config config;
    try {
        if (!opts.config_path.empty()) {
            config = Config::from_file(opts.config_path);
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    if (opts.verbose) {
        config.with_log_level(util::Severity::DBG);
    }
    util::LogService::init(config.log);

    json scenario;
    {
        std::ifstream file{opts.scenario_path};
        if (!file.is_open()) {
            std::cerr << "Cannot open scenario file: " << opts.scenario_path << "\n";
            return 1;
        }
        try {
            scenario = json::parse(file);
        } catch (const json::parse_error& e) {
            std::cerr << "Scenario parse error: " << e.what() << "\n";
            return 1;
        }
    }

    // Fixed clock when the scenario pins the time
    Clock clock;
    if (scenario.contains("time")) {
        uint64_t now = scenario.at("time").get<uint64_t>();
        clock = [now] { return now; };
    }

    TokenLedger ledger;
    AmmEngine engine(ledger, config.engine, clock);

    EventPrinter printer;
    if (opts.events) {
        engine.add_listener(&printer);
    }

    int failures = 0;
    size_t index = 0;
    for (const auto& step : scenario.at("steps")) {
        json result;
        try {
            result = run_step(ledger, engine, step);
        } catch (const std::exception& e) {
            result = {{"op", step.value("op", "")}, {"error", "BAD_STEP"}, {"detail", e.what()}};
        }
        result["step"] = index++;
        if (result["error"] != "OK") ++failures;
        std::cout << result.dump() << "\n";
    }

    auto stats = engine.get_stats();
    std::cout << json{
        {"pairs", stats.total_pairs},
        {"swaps", stats.total_swaps},
        {"liquidity_ops", stats.total_liquidity_ops},
        {"failed_steps", failures},
    }.dump() << "\n";

    return 0;
}
