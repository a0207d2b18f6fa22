#pragma once

#include "backoff.hpp"
#include "clock.hpp"
#include "collaborators.hpp"
#include "model.hpp"
#include "oracle_keys.hpp"
#include "types.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace proofline
{

    enum class RequestState
    {
        Created,
        Submitted,
        Finalized,
        TimedOut,
        Rejected,
        Abandoned
    };

    std::string request_state_to_string(RequestState state);

    inline bool is_terminal(RequestState state)
    {
        return state == RequestState::Finalized || state == RequestState::TimedOut ||
               state == RequestState::Rejected || state == RequestState::Abandoned;
    }

    struct StateTransition
    {
        RequestState state;
        Timestamp at;
        std::string note;
    };

    /**
     * One attestation attempt against the oracle.
     *
     * created -> submitted -> finalized | timed_out | rejected, with abandoned
     * reachable from any non-terminal state (cancellation, exhausted retries).
     */
    struct AttestationRequest
    {
        Digest document_id;
        ContentLocator locator;
        Timestamp submitted_at;
        std::string request_id; // assigned by the oracle on submission
        RequestState state{RequestState::Created};
        std::vector<StateTransition> history;

        static AttestationRequest create(const Digest &document_id, const ContentLocator &locator, Timestamp now);

        /** Apply a transition; moving out of a terminal state is a programming error and is refused */
        Result<void> transition(RequestState to, Timestamp at, std::string note = {});
    };

    struct OracleClientConfig
    {
        std::chrono::milliseconds call_timeout{std::chrono::seconds(10)};
        std::chrono::milliseconds poll_interval{std::chrono::seconds(2)};
        BackoffPolicy backoff{};
        std::chrono::milliseconds ceiling{std::chrono::minutes(5)};
        std::chrono::milliseconds staleness_window{std::chrono::minutes(10)};
    };

    /** Outcome of report validation that did not reject the report */
    struct ReportAssessment
    {
        bool stale{false};
        std::vector<std::string> warnings;
    };

    /**
     * Validate an oracle report against what was submitted.
     *
     * Rejections (ValidationError, `field` set): request id mismatch, report
     * not finalized, reported digest != expected digest, signer not an
     * authorized key, bad signature. A report older than `staleness_window`
     * (or dated further than that into the future) is accepted and flagged.
     */
    Result<ReportAssessment> validate_report(
        const OracleReport &report,
        const std::string &expected_request_id,
        const Digest &expected_digest,
        const OracleKeyRing &keys,
        Timestamp now,
        std::chrono::milliseconds staleness_window);

    /** Signature-only check shared with the verifier */
    Result<void> check_report_signature(const OracleReport &report, const OracleKeyRing &keys);

    struct AttestationOutcome
    {
        AttestationRequest request;
        OracleReport report;
        ReportAssessment assessment;
    };

    /**
     * Drives AttestationRequests through submission, polling and validation.
     *
     * The oracle, key ring and clock are owned by the caller and must outlive
     * the client. Polling is authoritative; `notify` only shortens the current
     * wait so that a lost or duplicated push notification cannot change the outcome.
     */
    class OracleClient
    {
    public:
        OracleClient(Oracle &oracle, const OracleKeyRing &keys, const Clock &clock, OracleClientConfig cfg = {});

        /**
         * Submit `document_id` and block until the request reaches a terminal state.
         * @param record receives the final request state machine when non-null
         * @return validated report, or the terminal error (Validation for
         *         rejected, Timeout for timed out, Cancelled / TransientNetwork for abandoned)
         */
        Result<AttestationOutcome> attest(
            const Digest &document_id,
            const ContentLocator &locator,
            const CancellationToken &token = CancellationToken(),
            AttestationRequest *record = nullptr);

        /** Push-notification hook: poll `request_id` now instead of after the current delay */
        bool notify(const std::string &request_id);

        /** Abandon an in-flight request */
        bool cancel(const std::string &request_id);

        std::optional<RequestState> state_of(const std::string &request_id) const;

        const OracleClientConfig &config() const { return cfg_; }

    private:
        Result<std::string> submit(AttestationRequest &request, Timestamp deadline, const CancellationToken &token);
        Result<OracleReport> poll_until_final(AttestationRequest &request, Timestamp deadline, const CancellationToken &token);
        Result<AttestationOutcome> fail(AttestationRequest &request, RequestState state, ProoflineError error);

        void track(const AttestationRequest &request, const CancellationToken &token);
        void untrack(const std::string &request_id);

        struct InFlight
        {
            CancellationToken token;
            RequestState state;
        };

        Oracle &oracle_;
        const OracleKeyRing &keys_;
        const Clock &clock_;
        OracleClientConfig cfg_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, InFlight> in_flight_;
    };

} // namespace proofline
