#include "attestation.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "report_json.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void writeJson(const std::string& path, const std::string& jsonPayload) {
    if (path.empty()) {
        std::cout << jsonPayload << "\n";
        return;
    }
    std::ofstream ofs(path);
    if (!ofs) {
        throw std::runtime_error("Unable to open output path: " + path);
    }
    ofs << jsonPayload << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: sign_audit_root <round_id> <merkle_root_hex> <entry_count> <nonce> [output.json]\n";
        std::cerr << "Environment: HC_ENCLAVE_SEED or HC_DEV_SIGNING_SEED selects the signing key.\n";
        return 1;
    }

    try {
        auto cfg = hc::loadEngineConfig();
        auto signer = hc::makeSigner(cfg);

        hc::SignedAuditRoot msg;
        msg.roundId = argv[1];
        msg.merkleRoot = hc::parseHash32(argv[2]);
        msg.entryCount = std::stoull(argv[3]);
        msg.attestation.nonce = std::stoull(argv[4]);
        msg.attestation.digest = hc::AttestationService::encode(msg).digest();
        msg.attestation.signature = signer->sign(
            std::vector<std::uint8_t>(msg.attestation.digest.begin(), msg.attestation.digest.end()));

        if (!hc::AttestationService::verify(msg, signer->publicKey())) {
            std::cerr << "Signature failed self-verification\n";
            return 1;
        }

        writeJson(argc >= 6 ? argv[5] : "", hc::toJson(msg));
    } catch (const hc::GameError& ex) {
        std::cerr << hc::errorKindName(ex.kind()) << ": " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    return 0;
}
