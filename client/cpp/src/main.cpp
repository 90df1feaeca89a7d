// lend-cli - Lending Protocol Driver
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Runs the lending core in-process against an in-memory custody ledger and a
// trusted price store. Commands come from a script file or stdin; results are
// printed as JSON.

#include <lend/lend.hpp>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace lend;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Config {
    std::string config_path;
    std::string script_path;
    uint64_t start_time = 1700000000;
    bool verbose = false;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Session
//------------------------------------------------------------------------------

class Session {
public:
    explicit Session(const Config& config)
        : config_(load(config.config_path))
        , listener_(std::cerr, config.verbose)
        , now_(config.start_time)
        , protocol_(config_, feed_, custody_, [this] { return now_; })
    {
        protocol_.set_listener(&listener_);
        for (const auto& asset : config_.assets) {
            if (asset.initial_price_x18 > 0) {
                feed_.set_price(asset.asset_id, asset.initial_price_x18, now_);
            }
        }
    }

    json execute(const std::vector<std::string>& args);

private:
    static ProtocolConfig load(const std::string& path) {
        if (path.empty()) return ProtocolConfig::defaults();
        return ProtocolConfig::from_file(path);
    }

    static json code_json(int32_t code) {
        return {{"code", code}, {"error", errors::to_string(code)}};
    }

    ProtocolConfig config_;
    PriceFeed feed_;
    InMemoryCustody custody_;
    StreamListener listener_;
    uint64_t now_;
    LendingProtocol protocol_;
};

namespace {

uint64_t to_id(const std::string& s) {
    uint64_t id = 0;
    if (!parse_id(s, id)) throw std::invalid_argument("not an id: " + s);
    return id;
}

I128 to_amount(const std::string& s) {
    return x18::from_string(s);
}

json usage(const char* text) {
    return {{"error", std::string("usage: ") + text}};
}

} // namespace

json Session::execute(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    const size_t n = args.size();

    if (cmd == "register") {
        int64_t id = protocol_.register_user(n > 1 ? args[1] : std::string{});
        if (id < 0) return code_json(static_cast<int32_t>(id));
        return {{"user_id", id}};
    }
    if (cmd == "list_asset") {
        if (n < 3) return usage("list_asset <asset> <symbol> [reserve_factor]");
        AssetConfig asset;
        asset.asset_id = to_id(args[1]);
        asset.symbol = args[2];
        if (n > 3) asset.reserve_factor_x18 = to_amount(args[3]);
        return code_json(protocol_.list_asset(asset));
    }
    if (cmd == "mint") {
        if (n < 4) return usage("mint <user> <asset> <amount>");
        custody_.mint(to_id(args[1]), to_id(args[2]), to_amount(args[3]));
        return {{"balance", x18::to_string(custody_.balance_of(to_id(args[1]), to_id(args[2])))}};
    }
    if (cmd == "balance") {
        if (n < 3) return usage("balance <user> <asset>");
        return {{"balance", x18::to_string(custody_.balance_of(to_id(args[1]), to_id(args[2])))}};
    }
    if (cmd == "price") {
        if (n < 3) return usage("price <asset> <price>");
        return code_json(feed_.set_price(to_id(args[1]), to_amount(args[2]), now_));
    }
    if (cmd == "advance") {
        if (n < 2) return usage("advance <seconds>");
        now_ += to_id(args[1]);
        return {{"now", now_}};
    }
    if (cmd == "deposit") {
        if (n < 4) return usage("deposit <user> <asset> <amount>");
        return code_json(protocol_.deposit(to_id(args[1]), to_id(args[2]), to_amount(args[3])));
    }
    if (cmd == "withdraw") {
        if (n < 4) return usage("withdraw <user> <asset> <amount>");
        return code_json(protocol_.withdraw(to_id(args[1]), to_id(args[2]), to_amount(args[3])));
    }
    if (cmd == "collateral") {
        if (n < 4) return usage("collateral <user> <asset> <amount>");
        return code_json(protocol_.deposit_collateral(to_id(args[1]), to_id(args[2]), to_amount(args[3])));
    }
    if (cmd == "redeem") {
        if (n < 4) return usage("redeem <user> <asset> <amount>");
        return code_json(protocol_.redeem_collateral(to_id(args[1]), to_id(args[2]), to_amount(args[3])));
    }
    if (cmd == "convert") {
        if (n < 4) return usage("convert <user> <asset> <amount>");
        return code_json(protocol_.convert_to_collateral(to_id(args[1]), to_id(args[2]), to_amount(args[3])));
    }
    if (cmd == "unconvert") {
        if (n < 4) return usage("unconvert <user> <asset> <amount>");
        return code_json(protocol_.convert_to_deposit(to_id(args[1]), to_id(args[2]), to_amount(args[3])));
    }
    if (cmd == "borrow") {
        if (n < 6) return usage("borrow <user> <collateral_asset> <collateral_amount> <debt_asset> <amount>");
        int64_t id = protocol_.borrow(to_id(args[1]), to_id(args[2]), to_amount(args[3]),
                                      to_id(args[4]), to_amount(args[5]));
        if (id < 0) return code_json(static_cast<int32_t>(id));
        return {{"loan_id", id}};
    }
    if (cmd == "borrow_more") {
        if (n < 4) return usage("borrow_more <holder> <loan> <amount>");
        return code_json(protocol_.borrow_additional(to_id(args[1]), to_id(args[2]), to_amount(args[3])));
    }
    if (cmd == "add_collateral") {
        if (n < 4) return usage("add_collateral <borrower> <loan> <amount>");
        return code_json(protocol_.add_collateral(to_id(args[1]), to_id(args[2]), to_amount(args[3])));
    }
    if (cmd == "repay") {
        if (n < 4) return usage("repay <holder> <loan> <amount>");
        return as_json(protocol_.repay(to_id(args[1]), to_id(args[2]), to_amount(args[3])));
    }
    if (cmd == "liquidate") {
        if (n < 4) return usage("liquidate <liquidator> <loan> <amount>");
        return as_json(protocol_.liquidate(to_id(args[2]), to_amount(args[3]), to_id(args[1])));
    }
    if (cmd == "transfer_loan") {
        if (n < 4) return usage("transfer_loan <holder> <loan> <new_holder>");
        return code_json(protocol_.transfer_loan(to_id(args[1]), to_id(args[2]), to_id(args[3])));
    }
    if (cmd == "accrue") {
        if (n < 2) return usage("accrue <asset>");
        return code_json(protocol_.accrue(to_id(args[1])));
    }
    if (cmd == "pool") {
        if (n < 2) return usage("pool <asset>");
        auto state = protocol_.get_pool_state(to_id(args[1]));
        if (!state) return code_json(errors::UNKNOWN_ASSET);
        return as_json(*state);
    }
    if (cmd == "loan") {
        if (n < 2) return usage("loan <id>");
        auto loan = protocol_.get_loan(to_id(args[1]));
        if (!loan) return code_json(errors::UNKNOWN_LOAN);
        json out = as_json(*loan);
        if (auto risk = protocol_.get_loan_risk(loan->loan_id)) out["risk"] = as_json(*risk);
        if (auto headroom = protocol_.get_max_borrow(loan->loan_id)) {
            out["max_borrow"] = x18::to_string(*headroom);
        }
        return out;
    }
    if (cmd == "user") {
        if (n < 2) return usage("user <id>");
        auto record = protocol_.get_credit_record(to_id(args[1]));
        if (!record) return code_json(errors::UNKNOWN_USER);
        json out = as_json(*record);
        json values = json::object();
        for (const auto& [asset_id, scaled] : record->deposits()) {
            (void)scaled;
            if (auto v = protocol_.get_deposit_balance(record->user_id(), asset_id)) {
                values[std::to_string(asset_id)] = x18::to_string(*v);
            }
        }
        out["deposits"] = values;
        return out;
    }
    if (cmd == "bad_loans") {
        json ids = json::array();
        for (LoanId id : protocol_.find_bad_loans()) ids.push_back(id);
        return {{"bad_loans", ids}};
    }
    if (cmd == "stats") {
        return as_json(protocol_.get_stats());
    }
    if (cmd == "config") {
        return config_.to_json();
    }
    return {{"error", "unknown command: " + cmd}};
}

//------------------------------------------------------------------------------
// CLI Interface
//------------------------------------------------------------------------------

void print_help() {
    std::cout << R"(
lend-cli commands (amounts and prices are decimals, e.g. 7500 or 0.95):

  register [account]                       Create a credit record
  list_asset <asset> <symbol> [reserve]    List a new pool
  mint <user> <asset> <amount>             Fund a custody balance
  balance <user> <asset>                   Custody balance
  price <asset> <price>                    Set a feed price
  advance <seconds>                        Move the clock forward

  deposit <user> <asset> <amount>          Supply liquidity
  withdraw <user> <asset> <amount>
  collateral <user> <asset> <amount>       Post collateral
  redeem <user> <asset> <amount>           Withdraw free collateral
  convert <user> <asset> <amount>          Deposit -> collateral
  unconvert <user> <asset> <amount>        Free collateral -> deposit

  borrow <user> <c_asset> <c_amount> <d_asset> <amount>
  borrow_more <holder> <loan> <amount>
  add_collateral <borrower> <loan> <amount>
  repay <holder> <loan> <amount>
  liquidate <liquidator> <loan> <amount>
  transfer_loan <holder> <loan> <new_holder>
  accrue <asset>

  pool <asset> | loan <id> | user <id> | bad_loans | stats | config

  help
  quit / exit
)";
}

void print_message(const json& msg) {
    std::cout << msg.dump(2) << "\n";
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Returns false on quit
bool run_line(Session& session, const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return true;

    auto parts = split(line);
    for (auto& c : parts[0]) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (parts[0] == "quit" || parts[0] == "exit") return false;
    if (parts[0] == "help") {
        print_help();
        return true;
    }

    try {
        print_message(session.execute(parts));
    } catch (const std::exception& e) {
        std::cout << "Invalid argument: " << e.what() << "\n";
    }
    return true;
}

void run_interactive(Session& session) {
    std::cout << "lend-cli - Type 'help' for commands\n> ";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (!run_line(session, line)) {
            std::cout << "Goodbye\n";
            break;
        }
        std::cout << "> ";
    }
}

int run_script(Session& session, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Cannot open script: " << path << "\n";
        return 1;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!run_line(session, line)) break;
    }
    return 0;
}

void print_usage(const char* prog) {
    std::cout << "lend-cli - Lending Protocol Driver\n\n"
              << "Usage: " << prog << " [options] [command] [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Protocol config (JSON); defaults if omitted\n"
              << "  -s, --script <file>  Run commands from a file\n"
              << "  -t, --time <secs>    Starting clock (default: 1700000000)\n"
              << "  -v, --verbose        Log every protocol event to stderr\n"
              << "  -h, --help           Show this help message\n\n"
              << "Examples:\n"
              << "  " << prog << " -c config/lend.example.json            # Interactive mode\n"
              << "  " << prog << " -c config/lend.example.json -s run.txt\n"
              << "  " << prog << " config                                 # Print defaults\n";
}

Config parse_args(int argc, char* argv[]) {
    Config config;

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
            config.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--script") {
            if (i + 1 >= argc) {
                std::cerr << "Missing script argument\n";
                std::exit(1);
            }
            config.script_path = argv[++i];
        } else if (arg == "-t" || arg == "--time") {
            if (i + 1 >= argc) {
                std::cerr << "Missing time argument\n";
                std::exit(1);
            }
            config.start_time = std::stoull(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg[0] != '-') {
            // Command and its arguments
            while (i < argc) {
                config.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    return config;
}

int main(int argc, char* argv[]) {
    Config config = parse_args(argc, argv);

    std::unique_ptr<Session> session;
    try {
        session = std::make_unique<Session>(config);
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    if (!config.command_args.empty()) {
        std::string line;
        for (const auto& a : config.command_args) line += a + " ";
        run_line(*session, line);
        return 0;
    }
    if (!config.script_path.empty()) {
        return run_script(*session, config.script_path);
    }

    run_interactive(*session);
    return 0;
}
