#pragma once

#include "ChecksumEngine.hpp"
#include "MigrationTypes.hpp"
#include "RemoteExecutor.hpp"

#include <string>

enum class VerificationStatus {
    VERIFIED,
    CORRUPTED
};

struct VerificationResult {
    VerificationStatus status = VerificationStatus::CORRUPTED;
    DiffResult diff;
    std::string destinationAggregate;

    bool Verified() const { return status == VerificationStatus::VERIFIED; }
    std::string Summary() const;
};

class Verifier {
public:
    explicit Verifier(const ChecksumEngine& engine);

    // Re-hashes destRoot on the destination and compares it against the
    // manifest captured before transfer. Extra files are reported, not fatal.
    VerificationResult Verify(const ChecksumManifest& manifest, const std::string& destRoot, const RemoteExecutor& destination) const;

private:
    const ChecksumEngine& engine_;
};
