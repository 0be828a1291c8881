#include "core/distributor.h"
#include "database/database.h"
#include "database/db_adapters.h"
#include "database/ledger_store.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <getopt.h>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace rentledger {

using json = nlohmann::json;
using core::Address;
using core::YieldDistributor;

struct CliConfig {
    std::string configPath;
    std::string dataDir;
    std::string logLevel;
    bool showHelp = false;
    bool showVersion = false;
    bool jsonOutput = false;
    std::vector<std::string> commandArgs;
};

void printHelp(const char* progName) {
    std::cout << "RentLedger v0.1.0 - Rental income distribution ledger\n\n";
    std::cout << "Usage: " << progName << " [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  init OWNER TREASURY OPERATOR SHARE_TOKEN ASSET\n";
    std::cout << "                              Create the ledger for ledger.property_id\n";
    std::cout << "  mint-shares HOLDER AMOUNT   Issue property shares to a holder\n";
    std::cout << "  burn-shares HOLDER AMOUNT   Retire property shares from a holder\n";
    std::cout << "  transfer-shares FROM TO AMOUNT\n";
    std::cout << "                              Move shares between holders\n";
    std::cout << "  fund ACCOUNT AMOUNT         Credit settlement funds to an account\n";
    std::cout << "  deposit CALLER AMOUNT       Deposit income into the open round\n";
    std::cout << "  deposit-rental CALLER AMOUNT\n";
    std::cout << "                              Pull income from the rental wallet\n";
    std::cout << "  finalize CALLER             Snapshot shares and finalize the open round\n";
    std::cout << "  claim HOLDER ROUND          Pay a holder's entitlement\n";
    std::cout << "  close CALLER ROUND          Sweep unclaimed funds after the grace period\n";
    std::cout << "  set-treasury CALLER ADDR    Reassign the treasury\n";
    std::cout << "  set-operator CALLER ADDR    Reassign the operator\n";
    std::cout << "  set-rental-wallet CALLER ADDR\n";
    std::cout << "                              Set the rent collection account\n";
    std::cout << "  propose-owner CALLER ADDR   Nominate a new owner\n";
    std::cout << "  accept-owner CALLER         Accept a pending nomination\n";
    std::cout << "  status                      Show roles, totals and the open round\n";
    std::cout << "  round ID                    Show one round\n";
    std::cout << "  entitlement ROUND HOLDER    Show a holder's entitlement and claim status\n";
    std::cout << "  balance ACCOUNT             Show settlement and share balances\n";
    std::cout << "  events [FROM] [LIMIT]       List recorded events\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n";
    std::cout << "  -c, --config FILE   Use custom config file\n";
    std::cout << "  -D, --datadir DIR   Data directory\n";
    std::cout << "  -j, --json          Print results as JSON\n";
    std::cout << "  --loglevel LEVEL    Log level (trace/debug/info/warn/error)\n";
}

void printVersion() {
    std::cout << "RentLedger v0.1.0\n";
    std::cout << "Ledger schema version: " << database::LedgerStore::SCHEMA_VERSION << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool parseArgs(int argc, char* argv[], CliConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'D'},
        {"json", no_argument, nullptr, 'j'},
        {"loglevel", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "+hvc:D:jl:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configPath = optarg;
                break;
            case 'D':
                config.dataDir = optarg;
                break;
            case 'j':
                config.jsonOutput = true;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        config.commandArgs.emplace_back(argv[i]);
    }
    return true;
}

static bool parseAmount(const std::string& text, uint64_t& out) {
    if (text.empty() || text.size() > 20) return false;
    if (text.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        out = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

static json roundToJson(const core::RoundRecord& r) {
    json out;
    out["id"] = r.id;
    out["state"] = core::roundStateToString(r.state);
    out["deposited"] = r.deposited;
    out["carriedIn"] = r.carriedIn;
    out["pool"] = r.pool();
    out["totalEntitled"] = r.totalEntitled;
    out["remainder"] = r.remainder;
    out["claimed"] = r.claimedAmount;
    out["entitledHolders"] = r.entitledHolders;
    out["claimedHolders"] = r.claimedHolders;
    out["finalizedAt"] = r.finalizedAt;
    out["closedAt"] = r.closedAt;
    out["swept"] = r.sweptAmount;
    if (r.state == core::RoundState::FINALIZED || r.state == core::RoundState::CLOSED) {
        json snapshot;
        snapshot["totalShares"] = r.snapshot.totalShares;
        snapshot["takenAt"] = r.snapshot.takenAt;
        json balances = json::object();
        for (const auto& entry : r.snapshot.balances) {
            balances[entry.first] = entry.second;
        }
        snapshot["balances"] = balances;
        out["snapshot"] = snapshot;
    }
    return out;
}

static void printRound(const core::RoundRecord& r) {
    std::cout << "round=" << r.id << "\n";
    std::cout << "state=" << core::roundStateToString(r.state) << "\n";
    std::cout << "deposited=" << r.deposited << "\n";
    std::cout << "carried_in=" << r.carriedIn << "\n";
    std::cout << "pool=" << r.pool() << "\n";
    if (r.state == core::RoundState::FINALIZED || r.state == core::RoundState::CLOSED) {
        std::cout << "total_entitled=" << r.totalEntitled << "\n";
        std::cout << "remainder=" << r.remainder << "\n";
        std::cout << "claimed=" << r.claimedAmount << "\n";
        std::cout << "holders=" << r.claimedHolders << "/" << r.entitledHolders << "\n";
        std::cout << "total_shares=" << r.snapshot.totalShares << "\n";
        std::cout << "finalized_at=" << r.finalizedAt << "\n";
    }
    if (r.state == core::RoundState::CLOSED) {
        std::cout << "closed_at=" << r.closedAt << "\n";
        std::cout << "swept=" << r.sweptAmount << "\n";
    }
}

static int reportError(const Error& err) {
    std::cerr << "error: " << errorCodeName(err.code) << ": " << err.message << "\n";
    return 1;
}

// One command against the persisted ledger: open, load, run, save. All
// writes, including vault and registry balances, share one sqlite
// transaction.
class LedgerSession {
public:
    explicit LedgerSession(const utils::LedgerConfig& cfg) : cfg_(cfg), store_(db_) {}

    ~LedgerSession() {
        if (db_.inTransaction()) db_.rollbackTransaction();
        db_.close();
    }

    Result<void> open() {
        std::error_code ec;
        std::filesystem::create_directories(cfg_.dataDir, ec);
        std::string path = (std::filesystem::path(cfg_.dataDir) / cfg_.dbFile).string();
        if (!db_.open(path)) {
            return makeError(ErrorCode::DATABASE_ERROR, "cannot open " + path + ": " + db_.lastError());
        }
        if (!db_.beginTransaction()) {
            return makeError(ErrorCode::DATABASE_ERROR, "cannot start transaction: " + db_.lastError());
        }
        return {};
    }

    Result<void> load() {
        auto state = store_.load();
        if (state.failed()) return state.error();
        registry_ = std::make_shared<database::DatabaseShareRegistry>(db_, state.value().registryAddress);
        vault_ = std::make_shared<database::DatabaseVault>(db_, state.value().assetAddress);
        auto dist = YieldDistributor::restore(state.value(), registry_, vault_);
        if (dist.failed()) return dist.error();
        distributor_ = std::move(dist.value());
        return {};
    }

    Result<void> initialize(const core::DistributorParams& params, const Address& token, const Address& asset) {
        if (store_.exists()) {
            return makeError(ErrorCode::DATABASE_ERROR, "a ledger already exists in " + db_.getPath());
        }
        registry_ = std::make_shared<database::DatabaseShareRegistry>(db_, token);
        vault_ = std::make_shared<database::DatabaseVault>(db_, asset);
        auto dist = YieldDistributor::create(params, registry_, vault_);
        if (dist.failed()) return dist.error();
        distributor_ = std::move(dist.value());
        return {};
    }

    Result<void> commit() {
        if (distributor_) {
            auto saved = store_.save(distributor_->state());
            if (saved.failed()) return saved;
            auto appended = store_.appendEvents(distributor_->events());
            if (appended.failed()) return appended;
        }
        if (!db_.commitTransaction()) {
            return makeError(ErrorCode::DATABASE_ERROR, "commit failed: " + db_.lastError());
        }
        return {};
    }

    YieldDistributor& ledger() { return *distributor_; }
    database::DatabaseShareRegistry& registry() { return *registry_; }
    database::DatabaseVault& vault() { return *vault_; }
    database::LedgerStore& store() { return store_; }

private:
    utils::LedgerConfig cfg_;
    database::Database db_;
    database::LedgerStore store_;
    std::shared_ptr<database::DatabaseShareRegistry> registry_;
    std::shared_ptr<database::DatabaseVault> vault_;
    std::unique_ptr<YieldDistributor> distributor_;
};

class CommandRunner {
public:
    CommandRunner(const utils::LedgerConfig& cfg, bool jsonOutput) : cfg_(cfg), json_(jsonOutput) {}

    int run(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cerr << "No command given, see --help\n";
            return 1;
        }
        const std::string& cmd = args[0];

        if (cmd == "init") return cmdInit(args);
        if (cmd == "mint-shares" || cmd == "burn-shares") return cmdShares(args);
        if (cmd == "transfer-shares") return cmdTransferShares(args);
        if (cmd == "fund") return cmdFund(args);
        if (cmd == "deposit" || cmd == "deposit-rental") return cmdDeposit(args);
        if (cmd == "finalize") return cmdFinalize(args);
        if (cmd == "claim") return cmdClaim(args);
        if (cmd == "close") return cmdClose(args);
        if (cmd == "set-treasury" || cmd == "set-operator" || cmd == "set-rental-wallet" ||
            cmd == "propose-owner") {
            return cmdRole(args);
        }
        if (cmd == "accept-owner") return cmdAcceptOwner(args);
        if (cmd == "status") return cmdStatus(args);
        if (cmd == "round") return cmdRound(args);
        if (cmd == "entitlement") return cmdEntitlement(args);
        if (cmd == "balance") return cmdBalance(args);
        if (cmd == "events") return cmdEvents(args);

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;
    }

private:
    bool expectArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
        if (args.size() == count) return true;
        std::cerr << "Usage: rentledgerd " << usage << "\n";
        return false;
    }

    bool amountArg(const std::string& text, uint64_t& out) {
        if (parseAmount(text, out)) return true;
        std::cerr << "error: InvalidAmount: '" << text << "' is not a whole number of units\n";
        return false;
    }

    // Runs fn inside a loaded session and commits when it succeeds.
    int mutate(const std::function<Result<void>(LedgerSession&)>& fn) {
        LedgerSession session(cfg_);
        auto opened = session.open();
        if (opened.failed()) return reportError(opened.error());
        auto loaded = session.load();
        if (loaded.failed()) return reportError(loaded.error());
        auto res = fn(session);
        if (res.failed()) return reportError(res.error());
        auto committed = session.commit();
        if (committed.failed()) return reportError(committed.error());
        return 0;
    }

    int query(const std::function<int(LedgerSession&)>& fn) {
        LedgerSession session(cfg_);
        auto opened = session.open();
        if (opened.failed()) return reportError(opened.error());
        auto loaded = session.load();
        if (loaded.failed()) return reportError(loaded.error());
        return fn(session);
    }

    int cmdInit(const std::vector<std::string>& args) {
        if (!expectArgs(args, 6, "init OWNER TREASURY OPERATOR SHARE_TOKEN ASSET")) return 1;
        core::DustPolicy policy;
        if (!core::parseDustPolicy(cfg_.dustPolicy, policy)) {
            std::cerr << "error: unknown ledger.dust_policy '" << cfg_.dustPolicy << "'\n";
            return 1;
        }
        core::DistributorParams params;
        params.propertyId = cfg_.propertyId;
        params.owner = args[1];
        params.treasury = args[2];
        params.operatorAddress = args[3];
        params.gracePeriod = cfg_.gracePeriod;
        params.dustPolicy = policy;

        LedgerSession session(cfg_);
        auto opened = session.open();
        if (opened.failed()) return reportError(opened.error());
        auto created = session.initialize(params, args[4], args[5]);
        if (created.failed()) return reportError(created.error());
        auto committed = session.commit();
        if (committed.failed()) return reportError(committed.error());
        std::cout << "initialized ledger for property " << params.propertyId << "\n";
        return 0;
    }

    int cmdShares(const std::vector<std::string>& args) {
        bool mint = args[0] == "mint-shares";
        if (!expectArgs(args, 3, mint ? "mint-shares HOLDER AMOUNT" : "burn-shares HOLDER AMOUNT")) return 1;
        uint64_t amount;
        if (!amountArg(args[2], amount)) return 1;
        return mutate([&](LedgerSession& s) -> Result<void> {
            auto res = mint ? s.registry().mint(args[1], amount) : s.registry().burn(args[1], amount);
            if (res.failed()) return res;
            std::cout << args[1] << " shares=" << s.registry().balanceOf(args[1])
                      << " total_shares=" << s.registry().totalShares() << "\n";
            return {};
        });
    }

    int cmdTransferShares(const std::vector<std::string>& args) {
        if (!expectArgs(args, 4, "transfer-shares FROM TO AMOUNT")) return 1;
        uint64_t amount;
        if (!amountArg(args[3], amount)) return 1;
        return mutate([&](LedgerSession& s) -> Result<void> {
            auto res = s.registry().transfer(args[1], args[2], amount);
            if (res.failed()) return res;
            std::cout << "moved " << amount << " shares\n";
            return {};
        });
    }

    int cmdFund(const std::vector<std::string>& args) {
        if (!expectArgs(args, 3, "fund ACCOUNT AMOUNT")) return 1;
        uint64_t amount;
        if (!amountArg(args[2], amount)) return 1;
        return mutate([&](LedgerSession& s) -> Result<void> {
            auto res = s.vault().credit(args[1], amount);
            if (res.failed()) return res;
            std::cout << args[1] << " balance=" << s.vault().balanceOf(args[1]) << "\n";
            return {};
        });
    }

    int cmdDeposit(const std::vector<std::string>& args) {
        bool rental = args[0] == "deposit-rental";
        if (!expectArgs(args, 3, rental ? "deposit-rental CALLER AMOUNT" : "deposit CALLER AMOUNT")) return 1;
        uint64_t amount;
        if (!amountArg(args[2], amount)) return 1;
        return mutate([&](LedgerSession& s) -> Result<void> {
            auto res = rental ? s.ledger().depositFromRentalWallet(args[1], amount)
                              : s.ledger().deposit(args[1], amount);
            if (res.failed()) return res;
            std::cout << "deposited " << amount << " into round " << s.ledger().currentRoundId() << "\n";
            return {};
        });
    }

    int cmdFinalize(const std::vector<std::string>& args) {
        if (!expectArgs(args, 2, "finalize CALLER")) return 1;
        return mutate([&](LedgerSession& s) -> Result<void> {
            auto res = s.ledger().finalizeRound(args[1]);
            if (res.failed()) return res.error();
            auto r = s.ledger().round(res.value());
            if (r.failed()) return r.error();
            if (json_) {
                std::cout << roundToJson(r.value()).dump(2) << "\n";
            } else {
                std::cout << "finalized round " << res.value() << ": entitled " << r.value().totalEntitled
                          << ", remainder " << r.value().remainder << "\n";
            }
            return {};
        });
    }

    int cmdClaim(const std::vector<std::string>& args) {
        if (!expectArgs(args, 3, "claim HOLDER ROUND")) return 1;
        uint64_t roundId;
        if (!amountArg(args[2], roundId)) return 1;
        return mutate([&](LedgerSession& s) -> Result<void> {
            auto res = s.ledger().claim(args[1], roundId);
            if (res.failed()) return res.error();
            std::cout << "claimed " << res.value() << " from round " << roundId << "\n";
            return {};
        });
    }

    int cmdClose(const std::vector<std::string>& args) {
        if (!expectArgs(args, 3, "close CALLER ROUND")) return 1;
        uint64_t roundId;
        if (!amountArg(args[2], roundId)) return 1;
        return mutate([&](LedgerSession& s) -> Result<void> {
            auto res = s.ledger().closeRound(args[1], roundId);
            if (res.failed()) return res.error();
            std::cout << "closed round " << roundId << ", swept " << res.value() << " to treasury\n";
            return {};
        });
    }

    int cmdRole(const std::vector<std::string>& args) {
        std::string usage = args[0] + " CALLER ADDRESS";
        if (!expectArgs(args, 3, usage.c_str())) return 1;
        const std::string& cmd = args[0];
        return mutate([&](LedgerSession& s) -> Result<void> {
            Result<void> res;
            if (cmd == "set-treasury") {
                res = s.ledger().setTreasury(args[1], args[2]);
            } else if (cmd == "set-operator") {
                res = s.ledger().setOperator(args[1], args[2]);
            } else if (cmd == "set-rental-wallet") {
                res = s.ledger().setRentalWallet(args[1], args[2]);
            } else {
                res = s.ledger().proposeOwner(args[1], args[2]);
            }
            if (res.failed()) return res;
            std::cout << cmd << " ok\n";
            return {};
        });
    }

    int cmdAcceptOwner(const std::vector<std::string>& args) {
        if (!expectArgs(args, 2, "accept-owner CALLER")) return 1;
        return mutate([&](LedgerSession& s) -> Result<void> {
            auto res = s.ledger().acceptOwnership(args[1]);
            if (res.failed()) return res;
            std::cout << "owner is now " << s.ledger().roles().owner << "\n";
            return {};
        });
    }

    int cmdStatus(const std::vector<std::string>& args) {
        if (!expectArgs(args, 1, "status")) return 1;
        return query([&](LedgerSession& s) {
            YieldDistributor& d = s.ledger();
            core::RoleSet roles = d.roles();
            core::LedgerTotals totals = d.totals();
            auto open = d.round(d.currentRoundId());
            if (open.failed()) return reportError(open.error());

            if (json_) {
                json out;
                out["propertyId"] = d.propertyId();
                out["propertyToken"] = d.registryAddress();
                out["asset"] = d.assetAddress();
                out["gracePeriod"] = d.gracePeriod();
                out["dustPolicy"] = core::dustPolicyToString(d.dustPolicy());
                out["roles"] = {
                    {"owner", roles.owner},
                    {"treasury", roles.treasury},
                    {"operator", roles.operatorAddress},
                    {"pendingOwner", roles.pendingOwner},
                    {"rentalWallet", roles.rentalWallet}
                };
                out["totals"] = {
                    {"deposited", totals.totalDeposited},
                    {"paidOut", totals.totalPaidOut},
                    {"carriedRemainder", totals.carriedRemainder},
                    {"fundsHeld", totals.fundsHeld}
                };
                out["currentRound"] = roundToJson(open.value());
                out["custody"] = s.vault().custody();
                std::cout << out.dump(2) << "\n";
                return 0;
            }

            std::cout << "property_id=" << d.propertyId() << "\n";
            std::cout << "property_token=" << d.registryAddress() << "\n";
            std::cout << "asset=" << d.assetAddress() << "\n";
            std::cout << "owner=" << roles.owner << "\n";
            std::cout << "treasury=" << roles.treasury << "\n";
            std::cout << "operator=" << roles.operatorAddress << "\n";
            if (!roles.pendingOwner.empty()) std::cout << "pending_owner=" << roles.pendingOwner << "\n";
            if (!roles.rentalWallet.empty()) std::cout << "rental_wallet=" << roles.rentalWallet << "\n";
            std::cout << "dust_policy=" << core::dustPolicyToString(d.dustPolicy()) << "\n";
            std::cout << "grace_period=" << d.gracePeriod() << "\n";
            std::cout << "current_round=" << d.currentRoundId() << "\n";
            std::cout << "current_round_state=" << core::roundStateToString(open.value().state) << "\n";
            std::cout << "current_round_pool=" << open.value().pool() << "\n";
            std::cout << "total_deposited=" << totals.totalDeposited << "\n";
            std::cout << "total_paid_out=" << totals.totalPaidOut << "\n";
            std::cout << "carried_remainder=" << totals.carriedRemainder << "\n";
            std::cout << "funds_held=" << totals.fundsHeld << "\n";
            std::cout << "custody=" << s.vault().custody() << "\n";
            return 0;
        });
    }

    int cmdRound(const std::vector<std::string>& args) {
        if (!expectArgs(args, 2, "round ID")) return 1;
        uint64_t roundId;
        if (!amountArg(args[1], roundId)) return 1;
        return query([&](LedgerSession& s) {
            auto r = s.ledger().round(roundId);
            if (r.failed()) return reportError(r.error());
            if (json_) {
                std::cout << roundToJson(r.value()).dump(2) << "\n";
            } else {
                printRound(r.value());
            }
            return 0;
        });
    }

    int cmdEntitlement(const std::vector<std::string>& args) {
        if (!expectArgs(args, 3, "entitlement ROUND HOLDER")) return 1;
        uint64_t roundId;
        if (!amountArg(args[1], roundId)) return 1;
        return query([&](LedgerSession& s) {
            auto amount = s.ledger().entitlementOf(roundId, args[2]);
            if (amount.failed()) return reportError(amount.error());
            auto claimed = s.ledger().isClaimed(roundId, args[2]);
            if (claimed.failed()) return reportError(claimed.error());
            if (json_) {
                json out;
                out["round"] = roundId;
                out["holder"] = core::AddressUtil::normalize(args[2]);
                out["entitlement"] = amount.value();
                out["claimed"] = claimed.value();
                std::cout << out.dump(2) << "\n";
            } else {
                std::cout << "entitlement=" << amount.value() << "\n";
                std::cout << "claimed=" << (claimed.value() ? "yes" : "no") << "\n";
            }
            return 0;
        });
    }

    int cmdBalance(const std::vector<std::string>& args) {
        if (!expectArgs(args, 2, "balance ACCOUNT")) return 1;
        return query([&](LedgerSession& s) {
            if (json_) {
                json out;
                out["account"] = core::AddressUtil::normalize(args[1]);
                out["balance"] = s.vault().balanceOf(args[1]);
                out["shares"] = s.registry().balanceOf(args[1]);
                std::cout << out.dump(2) << "\n";
            } else {
                std::cout << "balance=" << s.vault().balanceOf(args[1]) << "\n";
                std::cout << "shares=" << s.registry().balanceOf(args[1]) << "\n";
            }
            return 0;
        });
    }

    int cmdEvents(const std::vector<std::string>& args) {
        if (args.size() > 3) {
            std::cerr << "Usage: rentledgerd events [FROM] [LIMIT]\n";
            return 1;
        }
        uint64_t from = 0, limit = 0;
        if (args.size() > 1 && !amountArg(args[1], from)) return 1;
        if (args.size() > 2 && !amountArg(args[2], limit)) return 1;
        return query([&](LedgerSession& s) {
            auto events = s.store().loadEvents(from, static_cast<size_t>(limit));
            if (events.failed()) return reportError(events.error());
            if (json_) {
                json out = json::array();
                for (const auto& ev : events.value()) out.push_back(json::parse(ev.toJson()));
                std::cout << out.dump(2) << "\n";
            } else {
                for (const auto& ev : events.value()) std::cout << ev.toJson() << "\n";
            }
            return 0;
        });
    }

    utils::LedgerConfig cfg_;
    bool json_;
};

bool configure(const CliConfig& cli) {
    utils::Config& config = utils::Config::instance();
    if (!cli.dataDir.empty()) {
        config.setDataDir(cli.dataDir);
        config.set("ledger.data_dir", cli.dataDir);
    }

    std::string configPath = cli.configPath;
    if (configPath.empty()) {
        std::string candidate = config.getDataDir() + "/rentledger.conf";
        if (std::filesystem::exists(candidate)) configPath = candidate;
    }
    if (!configPath.empty() && !config.load(configPath)) {
        std::cerr << "Cannot read config file: " << configPath << "\n";
        return false;
    }
    // The command line wins over the file.
    if (!cli.dataDir.empty()) config.set("ledger.data_dir", cli.dataDir);
    if (!cli.logLevel.empty()) config.set("log.level", cli.logLevel);

    utils::LogConfig logCfg = config.getLogConfig();
    utils::LogLevel level;
    if (!utils::Logger::parseLevel(logCfg.level, level)) {
        std::cerr << "Unknown log level: " << logCfg.level << "\n";
        return false;
    }
    utils::LedgerConfig ledgerCfg = config.getLedgerConfig();
    utils::Logger::init((std::filesystem::path(ledgerCfg.dataDir) / logCfg.file).string());
    utils::Logger::setLevel(level);
    utils::Logger::enableConsole(logCfg.console);
    utils::Logger::setRotation(logCfg.maxFileSize, logCfg.maxFiles);
    if (logCfg.showAddresses) utils::Logger::setShowAddresses(true);
    return true;
}

}

int main(int argc, char* argv[]) {
    rentledger::CliConfig cli;

    if (!rentledger::parseArgs(argc, argv, cli)) {
        return 1;
    }

    if (cli.showHelp) {
        rentledger::printHelp(argv[0]);
        return 0;
    }

    if (cli.showVersion) {
        rentledger::printVersion();
        return 0;
    }

    if (cli.commandArgs.empty()) {
        rentledger::printHelp(argv[0]);
        return 1;
    }

    if (!rentledger::configure(cli)) {
        return 1;
    }

    rentledger::CommandRunner runner(rentledger::utils::Config::instance().getLedgerConfig(), cli.jsonOutput);
    int result = runner.run(cli.commandArgs);

    rentledger::utils::Logger::shutdown();
    return result;
}
