#pragma once

#include "addresses.hpp"
#include "instructions.hpp"

namespace ordermill {

// How signatures are presented to the native verifier
enum class VerificationMode : uint8_t {
    Individual = 1,     // One inline instruction per party
    Batch = 2,          // One inline instruction for all parties
    CrossReferenced = 3 // Header-only instructions pointing into the settlement payload
};

// Assembles verification instructions (taker first, then makers in request
// order) followed by one settlement instruction. Holds only immutable
// configuration, so one instance may serve concurrent callers.
class MatchTransactionBuilder {
public:
    MatchTransactionBuilder(const ProgramConfig& config, AddressDeriver deriver,
                            VerificationMode mode = VerificationMode::Individual);

    // Validates everything before assembling; throws ProtocolError (Structural,
    // Authentication, Temporal or Economic) naming the first offending order.
    [[nodiscard]] Transaction build(const MatchRequest& request, Timestamp now) const;

    // Validation only, same errors as build
    void validate(const MatchRequest& request, Timestamp now) const;

    [[nodiscard]] VerificationMode mode() const { return m_mode; }

private:
    [[nodiscard]] std::vector<Instruction> verificationInstructions(const MatchRequest& request) const;

    AddressBook m_addresses;
    VerificationMode m_mode;
};

} // namespace ordermill
