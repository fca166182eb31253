#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pm {

struct InclusionStep {
    std::string hash;
    bool siblingIsLeft = false;
};

// Append-only audit log of committed ledger transactions. Leaves are SHA-256
// hex digests of the event text; the root commits to the whole history.
class TranscriptLog {
public:
    std::string append(const std::string& event);
    std::string getLeaf(std::size_t index) const;
    const std::vector<std::string>& getLeaves() const { return leaves_; }
    const std::vector<std::string>& getEvents() const { return events_; }

    std::string merkleRoot() const;
    std::vector<InclusionStep> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& leafHash,
                            const std::vector<InclusionStep>& proof,
                            const std::string& root);

    std::size_t size() const { return leaves_.size(); }
    void clear();

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> leaves_;
    std::vector<std::string> events_;
};

} // namespace pm
