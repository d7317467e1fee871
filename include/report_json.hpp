#pragma once

#include "attestation.hpp"
#include "round_manager.hpp"

#include <string>

namespace hc {

// Compact JSON renderings of engine results. Amounts and distances are
// rendered as decimal strings, hashes and signatures as 0x-prefixed hex.
std::string toJson(const SignedRoundStart& msg);
std::string toJson(const SignedHint& msg);
std::string toJson(const SignedPriceUpdate& msg);
std::string toJson(const SignedWinnerDeclaration& msg);
std::string toJson(const SignedAuditRoot& msg);
std::string toJson(const StartRoundResult& result);
std::string toJson(const GuessOutcome& outcome);
std::string toJson(const RoundSnapshot& round);
std::string toJson(const AuditReport& report);
std::string toJson(const RevealedTarget& revealed);
std::string toJson(const AttestationIdentity& identity);

std::string errorJson(const std::string& kind, const std::string& message);

} // namespace hc
