#include "engine_config.hpp"
#include "market_engine.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace fa;

namespace {

class ConsoleEventSink : public EventSink {
public:
    void publish(const MarketEvent& event) override {
        std::cout << "  [event #" << event.sequence << "] " << toString(event.type) << " market="
                  << event.marketId.substr(0, 8);
        if (!event.userIds.empty()) {
            std::cout << " users=";
            for (std::size_t i = 0; i < event.userIds.size(); ++i) {
                std::cout << (i ? "," : "") << event.userIds[i];
            }
        }
        std::cout << " " << event.detail << "\n";
    }
};

void printHelp() {
    std::cout << "Commands:\n"
              << "  create <minutes> <outcome,outcome,...> <question...>\n"
              << "  markets\n"
              << "  state <market>\n"
              << "  quote <market> <outcome> <amount>\n"
              << "  bet <market> <outcome> <amount> <user>\n"
              << "  vote <market> <voter> <outcome> [weight] [confidence]\n"
              << "  pause|resume|close|refund|cancel|settle <market>\n"
              << "  resolve <market> [outcome]\n"
              << "  positions|payouts <market>\n"
              << "  sweep | audit | flush | help | quit\n"
              << "Markets can be referenced by full id or by #n in creation order.\n";
}

void printError(const EngineError& error) {
    std::cout << "error: " << error.describe();
    if (isRetryable(error.kind)) {
        std::cout << " (retry)";
    }
    std::cout << "\n";
}

void printState(const MarketState& state) {
    std::cout << state.id << "  \"" << state.question << "\"\n";
    std::cout << "  status=" << toString(state.status) << (state.halted ? " HALTED" : "")
              << " volume=" << state.totalVolume.toString() << " trades=" << state.totalTrades << "\n";
    for (const auto& outcome : state.outcomes) {
        std::cout << "  " << std::setw(12) << std::left << outcome.outcome << " price="
                  << outcome.impliedPrice.toString() << " display=" << outcome.displayPrice.toString()
                  << " shares=" << outcome.shareReserve.toString() << " cash=" << outcome.cashReserve.toString()
                  << "\n";
    }
    if (state.winningOutcome) {
        std::cout << "  winner=" << *state.winningOutcome << "\n";
    }
    if (state.resolution) {
        std::cout << "  resolution method=" << toString(state.resolution->method)
                  << " payout=" << state.resolution->totalPayout.toString()
                  << " liabilityRoot=" << state.resolution->liabilityRoot << "\n";
    }
}

void printReport(const ResolutionReport& report) {
    const auto& settlement = report.settlement;
    std::cout << "market " << toString(report.resolution.finalStatus) << " via "
              << toString(report.resolution.method);
    if (report.resolution.winningOutcome) {
        std::cout << ", winner " << *report.resolution.winningOutcome;
    }
    std::cout << "\n  paid in=" << settlement.totalPaidIn.toString() << " gross=" << settlement.totalGross.toString()
              << " fees=" << settlement.totalFees.toString() << " net=" << settlement.totalNet.toString() << "\n";
    std::cout << "  liability root " << settlement.liability.merkleRoot << "\n";
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

} // namespace

int main() {
    EngineConfig cfg;
    try {
        cfg = loadEngineConfig();
    } catch (const std::exception& ex) {
        std::cerr << "configuration error: " << ex.what() << "\n";
        return 1;
    }

    MarketEngine engine(cfg, nullptr, std::make_shared<ConsoleEventSink>());
    std::vector<std::string> created;

    auto marketRef = [&](const std::string& token) {
        if (!token.empty() && token[0] == '#') {
            try {
                std::size_t index = std::stoul(token.substr(1));
                if (index >= 1 && index <= created.size()) {
                    return created[index - 1];
                }
            } catch (const std::exception&) {
                return token;
            }
        }
        return token;
    };

    std::cout << "Forecast AMM console. liquidity=" << cfg.defaultInitialLiquidity.toString()
              << " bets " << cfg.minBet.toString() << ".." << cfg.maxBet.toString()
              << " houseEdgeBps=" << cfg.houseEdgeBps << " payout=" << toString(cfg.payoutPolicy)
              << " prices=" << toString(cfg.pricePolicy) << "\n";
    std::cout << "(FA_* environment variables override the defaults; type help for commands)\n";

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string command;
        if (!(in >> command)) {
            continue;
        }

        try {
            if (command == "quit" || command == "exit") {
                break;
            } else if (command == "help") {
                printHelp();
            } else if (command == "create") {
                long minutes = 0;
                std::string outcomes;
                if (!(in >> minutes >> outcomes)) {
                    std::cout << "usage: create <minutes> <outcome,outcome,...> <question...>\n";
                    continue;
                }
                std::string question;
                std::getline(in >> std::ws, question);
                MarketDefinition definition;
                definition.question = question;
                definition.outcomes = splitList(outcomes);
                definition.endTime = std::chrono::system_clock::now() + std::chrono::minutes(minutes);
                definition.creator = "console";
                auto market = engine.createMarket(definition);
                if (!market) {
                    printError(market.error());
                    continue;
                }
                created.push_back(market.value().id);
                std::cout << "created #" << created.size() << " " << market.value().id << "\n";
            } else if (command == "markets") {
                for (std::size_t i = 0; i < created.size(); ++i) {
                    auto state = engine.getMarketState(created[i]);
                    if (state) {
                        std::cout << "#" << (i + 1) << " " << created[i] << " " << toString(state.value().status)
                                  << "  " << state.value().question << "\n";
                    }
                }
            } else if (command == "state") {
                std::string ref;
                in >> ref;
                auto state = engine.getMarketState(marketRef(ref));
                if (!state) {
                    printError(state.error());
                    continue;
                }
                printState(state.value());
            } else if (command == "quote" || command == "bet") {
                std::string ref;
                std::string outcome;
                std::string amountText;
                std::string user;
                in >> ref >> outcome >> amountText >> user;
                auto amount = Fixed64::parse(amountText);
                if (!amount) {
                    std::cout << "invalid amount \"" << amountText << "\"\n";
                    continue;
                }
                if (command == "quote") {
                    auto quote = engine.getQuote(marketRef(ref), outcome, *amount);
                    if (!quote) {
                        printError(quote.error());
                        continue;
                    }
                    const auto& q = quote.value().quote;
                    std::cout << "shares=" << q.sharesOut.toString() << " avg=" << q.avgPricePerShare.toString()
                              << " price " << q.priceBefore.toString() << " -> " << q.priceAfter.toString()
                              << " impact=" << quote.value().priceImpactBps << "bps\n";
                } else {
                    if (user.empty()) {
                        std::cout << "usage: bet <market> <outcome> <amount> <user>\n";
                        continue;
                    }
                    auto position = engine.placeBet(marketRef(ref), outcome, *amount, user);
                    if (!position) {
                        printError(position.error());
                        continue;
                    }
                    std::cout << "position " << position.value().id << " shares="
                              << position.value().sharesAcquired.toString()
                              << " avg=" << position.value().avgPricePerShare.toString() << "\n";
                }
            } else if (command == "vote") {
                VoteRequest request;
                std::string ref;
                in >> ref >> request.voter >> request.outcome;
                request.marketId = marketRef(ref);
                std::uint32_t weight = 1;
                std::uint32_t confidence = 5;
                if (in >> weight) {
                    request.weight = weight;
                    if (in >> confidence) {
                        request.confidence = confidence;
                    }
                }
                auto vote = engine.castVote(request);
                if (!vote) {
                    printError(vote.error());
                    continue;
                }
                std::cout << "vote recorded for " << vote.value().chosenOutcome << "\n";
            } else if (command == "pause" || command == "resume" || command == "close") {
                std::string ref;
                in >> ref;
                auto market = (command == "pause")    ? engine.pause(marketRef(ref), "console")
                              : (command == "resume") ? engine.resume(marketRef(ref), "console")
                                                      : engine.close(marketRef(ref), "console");
                if (!market) {
                    printError(market.error());
                    continue;
                }
                std::cout << "market is now " << toString(market.value().status) << "\n";
            } else if (command == "resolve" || command == "refund" || command == "cancel") {
                std::string ref;
                std::string outcome;
                in >> ref >> outcome;
                const std::string id = marketRef(ref);
                auto report = (command == "refund")   ? engine.refund(id, "console")
                              : (command == "cancel") ? engine.cancel(id, "console")
                              : outcome.empty()       ? engine.resolve(id, std::nullopt, "console")
                                                      : engine.resolve(id, outcome, "console");
                if (!report) {
                    printError(report.error());
                    continue;
                }
                printReport(report.value());
            } else if (command == "settle") {
                std::string ref;
                in >> ref;
                auto report = engine.settle(marketRef(ref));
                if (!report) {
                    printError(report.error());
                    continue;
                }
                std::cout << (report.value().alreadySettled ? "already settled" : "settled") << ", "
                          << report.value().payouts.size() << " payouts, net "
                          << report.value().totalNet.toString() << "\n";
            } else if (command == "positions") {
                std::string ref;
                in >> ref;
                for (const auto& position : engine.positions(marketRef(ref))) {
                    std::cout << "  #" << position.sequence << " " << position.bettor << " " << position.outcome
                              << " paid=" << position.amountPaid.toString()
                              << " shares=" << position.sharesAcquired.toString() << " "
                              << toString(position.status) << "\n";
                }
            } else if (command == "payouts") {
                std::string ref;
                in >> ref;
                for (const auto& payout : engine.payouts(marketRef(ref))) {
                    std::cout << "  " << payout.bettor << " " << toString(payout.kind)
                              << " gross=" << payout.grossAmount.toString() << " fee=" << payout.fee.toString()
                              << " net=" << payout.netAmount.toString() << "\n";
                }
            } else if (command == "sweep") {
                auto summary = engine.sweep();
                std::cout << "ended=" << summary.ended << " refunded=" << summary.refunded
                          << " busy=" << summary.busy << "\n";
            } else if (command == "audit") {
                std::cout << "audit records=" << engine.audit().size() << " root=" << engine.auditRoot() << "\n";
            } else if (command == "flush") {
                std::cout << "redelivered " << engine.flushEvents() << " events, " << engine.pendingEvents()
                          << " pending\n";
                if (engine.pendingEvents() > 0) {
                    std::cout << "  " << engine.events().deliveryFailures()
                              << " failed deliveries so far, last error: " << engine.events().lastDeliveryError()
                              << "\n";
                }
            } else {
                std::cout << "unknown command \"" << command << "\" (type help)\n";
            }
        } catch (const InvariantViolationError& ex) {
            std::cerr << "ALERT: " << ex.what() << " (market halted)\n";
        }
    }

    std::cout << "Bye.\n";
    return 0;
}
