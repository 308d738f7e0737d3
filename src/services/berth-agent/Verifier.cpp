#include "Verifier.hpp"

#include <iostream>
#include <sstream>

namespace {
constexpr size_t kSummaryPaths = 5;

void AppendPaths(std::ostringstream& out, const char* label, const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return;
    }

    out << "; " << paths.size() << " " << label << " (";
    for (size_t i = 0; i < paths.size() && i < kSummaryPaths; ++i) {
        out << (i == 0 ? "" : ", ") << paths[i];
    }
    if (paths.size() > kSummaryPaths) {
        out << ", ...";
    }
    out << ")";
}
} // namespace

std::string VerificationResult::Summary() const {
    std::ostringstream out;
    out << (Verified() ? "verified" : "corrupted") << ": " << diff.matched.size() << " matched";
    AppendPaths(out, "mismatched", diff.mismatched);
    AppendPaths(out, "missing", diff.missing);
    AppendPaths(out, "extra", diff.extra);
    return out.str();
}

Verifier::Verifier(const ChecksumEngine& engine)
    : engine_(engine) {}

VerificationResult Verifier::Verify(
    const ChecksumManifest& manifest,
    const std::string& destRoot,
    const RemoteExecutor& destination) const {
    const ChecksumManifest actual = engine_.Generate(destination, destRoot);

    VerificationResult result;
    result.diff = ChecksumEngine::Compare(manifest, actual);
    result.destinationAggregate = actual.aggregate;
    result.status = result.diff.Clean() ? VerificationStatus::VERIFIED : VerificationStatus::CORRUPTED;

    if (!result.diff.extra.empty()) {
        std::cout << "[Verify] " << destRoot << " has " << result.diff.extra.size()
                  << " file(s) not present in the source manifest" << std::endl;
    }
    if (!result.Verified()) {
        std::cerr << "[Verify] " << destination.HostId() << ":" << destRoot << " " << result.Summary() << std::endl;
    }
    return result;
}
