#include "report_json.hpp"

#include "hex.hpp"

#include <iomanip>
#include <sstream>

namespace hc {

namespace {

std::string quote(const std::string& value) {
    std::ostringstream oss;
    oss << '"';
    for (unsigned char c : value) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        default:
            if (c < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                    << std::dec;
            } else {
                oss << static_cast<char>(c);
            }
        }
    }
    oss << '"';
    return oss.str();
}

void writeAttestation(std::ostringstream& json, const Attestation& att) {
    json << "\"nonce\":" << att.nonce << ",\"digest\":" << quote(toPrefixedHex(att.digest))
         << ",\"signature\":" << quote(toPrefixedHex(att.signature));
}

} // namespace

std::string toJson(const SignedRoundStart& msg) {
    std::ostringstream json;
    json << "{\"roundId\":" << quote(msg.roundId)
         << ",\"commitmentHash\":" << quote(toPrefixedHex(msg.commitmentHash))
         << ",\"baseBuyIn\":" << quote(formatWei(msg.baseBuyIn)) << ',';
    writeAttestation(json, msg.attestation);
    json << '}';
    return json.str();
}

std::string toJson(const SignedHint& msg) {
    std::ostringstream json;
    json << "{\"roundId\":" << quote(msg.roundId) << ",\"player\":" << quote(msg.player)
         << ",\"digitsCorrect\":" << static_cast<unsigned>(msg.digitsCorrect)
         << ",\"digitsInPlace\":" << static_cast<unsigned>(msg.digitsInPlace)
         << ",\"numericDistance\":" << quote(std::to_string(msg.numericDistance)) << ',';
    writeAttestation(json, msg.attestation);
    json << '}';
    return json.str();
}

std::string toJson(const SignedPriceUpdate& msg) {
    std::ostringstream json;
    json << "{\"roundId\":" << quote(msg.roundId) << ",\"newBuyIn\":" << quote(formatWei(msg.newBuyIn))
         << ',';
    writeAttestation(json, msg.attestation);
    json << '}';
    return json.str();
}

std::string toJson(const SignedWinnerDeclaration& msg) {
    std::ostringstream json;
    json << "{\"roundId\":" << quote(msg.roundId) << ",\"winner\":" << quote(msg.winner) << ',';
    writeAttestation(json, msg.attestation);
    json << '}';
    return json.str();
}

std::string toJson(const SignedAuditRoot& msg) {
    std::ostringstream json;
    json << "{\"roundId\":" << quote(msg.roundId) << ",\"merkleRoot\":" << quote(toPrefixedHex(msg.merkleRoot))
         << ",\"entryCount\":" << msg.entryCount << ',';
    writeAttestation(json, msg.attestation);
    json << '}';
    return json.str();
}

std::string toJson(const StartRoundResult& result) {
    std::ostringstream json;
    json << "{\"roundId\":" << quote(result.round.roundId)
         << ",\"commitmentHash\":" << quote(toPrefixedHex(result.round.commitmentHash))
         << ",\"baseBuyIn\":" << quote(formatWei(result.round.baseBuyIn))
         << ",\"signedStartRound\":" << toJson(result.signedStart) << '}';
    return json.str();
}

std::string toJson(const GuessOutcome& outcome) {
    const Hint& hint = outcome.hint;
    std::ostringstream json;
    json << "{\"hint\":{\"digitsInPlace\":" << static_cast<unsigned>(hint.digitsInPlace)
         << ",\"digitsCorrect\":" << static_cast<unsigned>(hint.digitsCorrect)
         << ",\"numericDistance\":" << quote(std::to_string(hint.numericDistance))
         << ",\"priceTier\":" << quote(priceTierName(hint.priceTier)) << '}'
         << ",\"signedHint\":" << toJson(outcome.signedHint) << ",\"pricingUpdate\":"
         << (outcome.priceUpdate ? toJson(*outcome.priceUpdate) : "null")
         << ",\"winner\":" << (outcome.winner ? toJson(*outcome.winner) : "null") << '}';
    return json.str();
}

std::string toJson(const RoundSnapshot& round) {
    std::ostringstream json;
    json << "{\"roundId\":" << quote(round.roundId) << ",\"status\":" << quote(roundStatusName(round.status))
         << ",\"currentBuyIn\":" << quote(formatWei(round.currentBuyIn))
         << ",\"pool\":" << quote(formatWei(round.pool)) << ",\"guessCount\":" << round.guessCount
         << ",\"priceTier\":" << quote(priceTierName(round.priceTier))
         << ",\"commitmentHash\":" << quote(toPrefixedHex(round.commitmentHash))
         << ",\"winner\":" << (round.winner ? quote(*round.winner) : "null") << '}';
    return json.str();
}

std::string toJson(const AuditReport& report) {
    std::ostringstream json;
    json << "{\"roundId\":" << quote(report.roundId) << ",\"entries\":[";
    for (std::size_t i = 0; i < report.entries.size(); ++i) {
        const auto& e = report.entries[i];
        if (i > 0) {
            json << ',';
        }
        json << "{\"index\":" << e.index << ",\"type\":" << quote(e.type) << ",\"roundId\":" << quote(e.roundId)
             << ",\"data\":" << quote(e.data) << ",\"timestamp\":" << e.timestamp
             << ",\"previousHash\":" << quote(toPrefixedHex(e.previousHash))
             << ",\"hash\":" << quote(toPrefixedHex(e.hash)) << '}';
    }
    json << "],\"merkleRoot\":"
         << (report.entries.empty() ? std::string("null") : quote(toPrefixedHex(report.merkleRoot)))
         << ",\"chainValid\":" << (report.chainValid ? "true" : "false")
         << ",\"signedMerkleRoot\":" << (report.signedRoot ? toJson(*report.signedRoot) : "null") << '}';
    return json.str();
}

std::string toJson(const RevealedTarget& revealed) {
    std::ostringstream json;
    json << "{\"roundId\":" << quote(revealed.roundId) << ",\"target\":" << quote(revealed.secret)
         << ",\"salt\":" << quote(toPrefixedHex(revealed.salt))
         << ",\"commitmentHash\":" << quote(toPrefixedHex(revealed.commitmentHash)) << '}';
    return json.str();
}

std::string toJson(const AttestationIdentity& identity) {
    std::ostringstream json;
    json << "{\"address\":" << quote(identity.address) << ",\"publicKey\":" << quote(identity.publicKey)
         << ",\"mode\":" << quote(identity.mode) << '}';
    return json.str();
}

std::string errorJson(const std::string& kind, const std::string& message) {
    std::ostringstream json;
    json << "{\"error\":" << quote(kind) << ",\"message\":" << quote(message) << '}';
    return json.str();
}

} // namespace hc
