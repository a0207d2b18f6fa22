#pragma once

#include "confirmation_tracker.hpp"
#include "digest.hpp"
#include "model.hpp"
#include "proof_artifact.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace proofline
{

    /**
     * Inputs of one assembly. Everything is borrowed and left untouched.
     */
    struct AssemblyInput
    {
        const Digest &document_id;
        const ContentLocator &locator;
        const Digest &metadata_digest;
        const OracleReport &report;
        const TrackingOutcome &tracking;
        Timestamp created_at;
        const std::vector<std::string> &warnings;
    };

    /**
     * Builds ProofArtifacts from the outputs of the earlier stages.
     *
     * A pure function of its input: assembling the same input twice yields
     * byte-identical artifacts. Refuses a still-pending aggregate unless the
     * tracking run was cut off by the caller, and refuses a report whose
     * digest is not the document id.
     */
    class ProofAssembler
    {
    public:
        static Result<ProofArtifact> assemble(const AssemblyInput &input);
    };

} // namespace proofline
