#include "config.hpp"
#include "errors.hpp"
#include "report_json.hpp"
#include "round_manager.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace hc;

namespace {

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

void printUsage() {
    std::cerr << "Commands:\n"
              << "  start [baseBuyInWei]\n"
              << "  guess <roundId> <player 0x..> <12 digits> [paidWei]\n"
              << "  status <roundId>\n"
              << "  audit <roundId>\n"
              << "  anchor <roundId>\n"
              << "  reveal <roundId>\n"
              << "  identity\n"
              << "  quit\n";
}

void logGuess(const GuessEvent& event) {
    std::cerr << "[round " << event.round.roundId << "] guess #" << event.round.guessCount << " by "
              << event.player << ": bulls=" << static_cast<unsigned>(event.hint.digitsInPlace)
              << " cows=" << static_cast<unsigned>(event.hint.digitsCorrect)
              << " distance=" << event.hint.numericDistance
              << " tier=" << priceTierName(event.round.priceTier);
    if (event.priceEscalated) {
        std::cerr << " (price now " << formatWei(event.round.currentBuyIn) << ")";
    }
    if (event.round.status == RoundStatus::Completed) {
        std::cerr << " WINNER";
    }
    std::cerr << "\n";
}

// Returns false when the loop should stop.
bool dispatch(RoundLifecycleManager& engine, const EngineConfig& cfg, const std::vector<std::string>& args) {
    const std::string& cmd = args.front();
    if (cmd == "quit" || cmd == "exit") {
        return false;
    }
    if (cmd == "start") {
        Wei baseBuyIn = args.size() > 1 ? parseWei(args[1]) : cfg.defaultBaseBuyIn;
        std::cout << toJson(engine.startRound(baseBuyIn)) << "\n";
    } else if (cmd == "guess" && args.size() >= 4) {
        // Payment verification belongs to the transport; without an explicit
        // amount the caller is assumed to have paid the current price.
        Wei paid = args.size() > 4 ? parseWei(args[4]) : engine.roundStatus(args[1]).currentBuyIn;
        std::cout << toJson(engine.submitGuess(args[1], args[2], args[3], paid)) << "\n";
    } else if (cmd == "status" && args.size() >= 2) {
        std::cout << toJson(engine.roundStatus(args[1])) << "\n";
    } else if (cmd == "audit" && args.size() >= 2) {
        std::cout << toJson(engine.auditReport(args[1])) << "\n";
    } else if (cmd == "anchor" && args.size() >= 2) {
        std::cout << toJson(engine.anchorAuditRoot(args[1])) << "\n";
    } else if (cmd == "reveal" && args.size() >= 2) {
        std::cout << toJson(engine.reveal(args[1])) << "\n";
    } else if (cmd == "identity") {
        std::cout << toJson(engine.identity()) << "\n";
    } else {
        std::cout << errorJson("ValidationError", "unknown command or missing arguments: " + cmd) << "\n";
        printUsage();
    }
    return true;
}

} // namespace

int main() {
    EngineConfig cfg;
    std::unique_ptr<RoundLifecycleManager> engine;
    try {
        cfg = loadEngineConfig();
        engine = makeInMemoryEngine(makeSigner(cfg), cfg.pricing, cfg.nonceFloor, cfg.firstRoundId);
    } catch (const GameError& ex) {
        std::cerr << "Enclave initialization failed [" << errorKindName(ex.kind()) << "]: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Enclave initialization failed: " << ex.what() << "\n";
        return 1;
    }

    engine->setGuessObserver(logGuess);

    const auto identity = engine->identity();
    std::cerr << "Enclave initialized in " << (cfg.signerMode == SignerMode::Tee ? "TEE" : "SIMULATION")
              << " mode\n";
    std::cerr << "Enclave address: " << identity.address << "\n";
    std::cerr << "Nonce floor: " << cfg.nonceFloor << "  first round id: " << cfg.firstRoundId << "\n";
    printUsage();

    std::string line;
    while (std::getline(std::cin, line)) {
        auto args = splitWords(line);
        if (args.empty()) {
            continue;
        }
        try {
            if (!dispatch(*engine, cfg, args)) {
                break;
            }
        } catch (const GameError& ex) {
            std::cout << errorJson(errorKindName(ex.kind()), ex.what()) << "\n";
            if (ex.kind() == ErrorKind::SignerUnavailable) {
                return 1;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Fatal engine failure: " << ex.what() << "\n";
            return 1;
        }
    }

    return 0;
}
