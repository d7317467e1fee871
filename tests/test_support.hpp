#pragma once

#include "errors.hpp"
#include "signer.hpp"
#include "target.hpp"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace hctest {

inline const std::string kSeedHex = "000102030405060708090a0b0c0d0e0f000102030405060708090a0b0c0d0e0f";

[[noreturn]] inline void fail(const std::string& suite, const std::string& msg) {
    std::cerr << suite << " failure: " << msg << std::endl;
    std::exit(1);
}

// Runs fn and reports whether it threw GameError of the expected kind.
inline bool throwsKind(hc::ErrorKind expected, const std::function<void()>& fn) {
    try {
        fn();
    } catch (const hc::GameError& ex) {
        return ex.kind() == expected;
    }
    return false;
}

inline std::shared_ptr<hc::Ed25519Signer> testSigner() {
    return hc::Ed25519Signer::fromSeedHex(kSeedHex, hc::SignerMode::Simulation);
}

// Hands out pre-chosen targets so tests know the secret. Salt bytes are the
// draw counter.
class ScriptedTargetSource : public hc::TargetSource {
public:
    explicit ScriptedTargetSource(std::deque<std::uint64_t> values) : values_(std::move(values)) {}

    std::uint64_t drawValue(std::uint64_t bound) override {
        if (values_.empty()) {
            return 0;
        }
        std::uint64_t value = values_.front();
        values_.pop_front();
        return value % bound;
    }

    hc::Salt drawSalt() override {
        hc::Salt salt{};
        salt.fill(static_cast<std::uint8_t>(++draws_));
        return salt;
    }

    static hc::Salt saltForDraw(std::uint8_t draw) {
        hc::Salt salt{};
        salt.fill(draw);
        return salt;
    }

private:
    std::deque<std::uint64_t> values_;
    std::uint8_t draws_ = 0;
};

// Delegates to a real key. failAfter(n) lets n more signatures through and
// then fails every later one.
class SwitchableSigner : public hc::Signer {
public:
    explicit SwitchableSigner(std::shared_ptr<hc::Ed25519Signer> inner) : inner_(std::move(inner)) {}

    std::vector<std::uint8_t> sign(const std::vector<std::uint8_t>& payload) const override {
        int remaining = remaining_.load();
        while (remaining > 0 && !remaining_.compare_exchange_weak(remaining, remaining - 1)) {
        }
        if (remaining == 0) {
            throw std::runtime_error("signing backend offline");
        }
        return inner_->sign(payload);
    }
    const std::vector<std::uint8_t>& publicKey() const override { return inner_->publicKey(); }
    const hc::Address& address() const override { return inner_->address(); }
    hc::SignerMode mode() const override { return inner_->mode(); }

    void failAfter(int signatures) { remaining_.store(signatures); }
    void breakSigning() { failAfter(0); }
    void restore() { remaining_.store(-1); }

private:
    std::shared_ptr<hc::Ed25519Signer> inner_;
    mutable std::atomic<int> remaining_{ -1 };
};

} // namespace hctest
