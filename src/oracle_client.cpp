#include "proofline/oracle_client.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>

namespace proofline
{

    namespace
    {
        constexpr const char *kStage = "oracle";

        std::chrono::milliseconds remaining(Timestamp now, Timestamp deadline)
        {
            if (now >= deadline)
                return std::chrono::milliseconds::zero();
            return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        }

        ProoflineError rejection(const std::string &message, const std::string &field)
        {
            ProoflineError err = ProoflineError::validation(message);
            err.at_stage(kStage).on_field(field);
            return err;
        }
    } // namespace

    std::string request_state_to_string(RequestState state)
    {
        switch (state)
        {
        case RequestState::Created:
            return "created";
        case RequestState::Submitted:
            return "submitted";
        case RequestState::Finalized:
            return "finalized";
        case RequestState::TimedOut:
            return "timed_out";
        case RequestState::Rejected:
            return "rejected";
        case RequestState::Abandoned:
            return "abandoned";
        }
        return "unknown";
    }

    // ============================================================================
    // AttestationRequest
    // ============================================================================

    AttestationRequest AttestationRequest::create(const Digest &document_id, const ContentLocator &locator, Timestamp now)
    {
        AttestationRequest request;
        request.document_id = document_id;
        request.locator = locator;
        request.submitted_at = now;
        request.state = RequestState::Created;
        request.history.push_back({RequestState::Created, now, "constructed locally"});
        return request;
    }

    Result<void> AttestationRequest::transition(RequestState to, Timestamp at, std::string note)
    {
        bool allowed = false;
        switch (state)
        {
        case RequestState::Created:
            allowed = to == RequestState::Submitted || to == RequestState::Rejected ||
                      to == RequestState::TimedOut || to == RequestState::Abandoned;
            break;
        case RequestState::Submitted:
            allowed = to == RequestState::Finalized || to == RequestState::Rejected ||
                      to == RequestState::TimedOut || to == RequestState::Abandoned;
            break;
        default:
            allowed = false;
            break;
        }

        if (!allowed)
        {
            return std::unexpected(ProoflineError::invalid_input(std::format(
                                       "Illegal request transition {} -> {}",
                                       request_state_to_string(state),
                                       request_state_to_string(to)))
                                       .at_stage(kStage));
        }

        state = to;
        history.push_back({to, at, std::move(note)});
        return {};
    }

    // ============================================================================
    // Report validation
    // ============================================================================

    Result<void> check_report_signature(const OracleReport &report, const OracleKeyRing &keys)
    {
        if (!keys.is_authorized(report.signer))
        {
            return std::unexpected(rejection(
                std::format("Report signed by unknown or revoked oracle key '{}'", report.signer), "signer"));
        }

        auto payload = report.signing_payload();
        if (!payload)
            return std::unexpected(payload.error());

        auto verified = keys.verify(report.signer, *payload, report.signature);
        if (!verified)
        {
            return std::unexpected(rejection(
                std::format("Malformed report signature: {}", verified.error().what()), "signature"));
        }
        if (!*verified)
        {
            return std::unexpected(rejection("Report signature does not verify against the oracle key", "signature"));
        }
        return {};
    }

    Result<ReportAssessment> validate_report(
        const OracleReport &report,
        const std::string &expected_request_id,
        const Digest &expected_digest,
        const OracleKeyRing &keys,
        Timestamp now,
        std::chrono::milliseconds staleness_window)
    {
        if (report.request_id != expected_request_id)
        {
            return std::unexpected(rejection("Report is for a different request", "request_id")
                                       .compared(expected_request_id, report.request_id));
        }

        if (!report.finalized)
        {
            return std::unexpected(rejection("Report is not finalized", "finalized"));
        }

        if (report.reported_digest != expected_digest)
        {
            return std::unexpected(rejection("Reported digest does not match the submitted document id", "reported_digest")
                                       .compared(expected_digest.to_hex(), report.reported_digest.to_hex()));
        }

        if (auto sig = check_report_signature(report, keys); !sig)
            return std::unexpected(sig.error());

        ReportAssessment assessment;
        auto age = now - report.issued_at;
        if (age > staleness_window)
        {
            assessment.stale = true;
            assessment.warnings.push_back(std::format(
                "oracle report issued at {} is older than the {} ms staleness window",
                format_timestamp(report.issued_at), staleness_window.count()));
        }
        else if (-age > staleness_window)
        {
            assessment.stale = true;
            assessment.warnings.push_back(std::format(
                "oracle report issued at {} is dated in the future",
                format_timestamp(report.issued_at)));
        }
        return assessment;
    }

    // ============================================================================
    // OracleClient
    // ============================================================================

    OracleClient::OracleClient(Oracle &oracle, const OracleKeyRing &keys, const Clock &clock, OracleClientConfig cfg)
        : oracle_(oracle), keys_(keys), clock_(clock), cfg_(std::move(cfg))
    {
    }

    Result<AttestationOutcome> OracleClient::attest(
        const Digest &document_id,
        const ContentLocator &locator,
        const CancellationToken &token,
        AttestationRequest *record)
    {
        auto request = AttestationRequest::create(document_id, locator, clock_.now());
        const Timestamp deadline = request.submitted_at + cfg_.ceiling;
        auto request_token = token.child();

        auto finish = [&](Result<AttestationOutcome> result) {
            if (!request.request_id.empty())
                untrack(request.request_id);
            if (record)
                *record = request;
            return result;
        };

        auto request_id = submit(request, deadline, request_token);
        if (!request_id)
            return finish(std::unexpected(request_id.error()));

        request.request_id = *request_id;
        if (auto t = request.transition(RequestState::Submitted, clock_.now(), "oracle accepted submission"); !t)
            return finish(std::unexpected(t.error()));
        track(request, request_token);
        spdlog::info("oracle request {} submitted for document {}", request.request_id, document_id.to_hex());

        auto report = poll_until_final(request, deadline, request_token);
        if (!report)
            return finish(std::unexpected(report.error()));

        auto assessment = validate_report(*report, request.request_id, document_id, keys_, clock_.now(), cfg_.staleness_window);
        if (!assessment)
        {
            spdlog::error("oracle request {} rejected: {}", request.request_id, assessment.error().describe());
            return finish(fail(request, RequestState::Rejected, assessment.error()));
        }

        for (const auto &warning : assessment->warnings)
        {
            spdlog::warn("oracle request {}: {}", request.request_id, warning);
        }

        if (auto t = request.transition(RequestState::Finalized, clock_.now(), "report validated"); !t)
            return finish(std::unexpected(t.error()));
        spdlog::info("oracle request {} finalized by signer {}", request.request_id, report->signer);

        return finish(AttestationOutcome{request, *report, *assessment});
    }

    Result<AttestationOutcome> OracleClient::fail(AttestationRequest &request, RequestState state, ProoflineError error)
    {
        if (error.stage.empty())
            error.at_stage(kStage);
        if (auto t = request.transition(state, clock_.now(), error.what()); !t)
            return std::unexpected(t.error());
        return std::unexpected(std::move(error));
    }

    Result<std::string> OracleClient::submit(AttestationRequest &request, Timestamp deadline, const CancellationToken &token)
    {
        std::size_t failures = 0;
        while (true)
        {
            if (token.is_cancelled())
            {
                auto failed = fail(request, RequestState::Abandoned, ProoflineError::cancelled("Attestation cancelled before submission"));
                return std::unexpected(failed.error());
            }

            auto now = clock_.now();
            auto left = remaining(now, deadline);
            if (left == std::chrono::milliseconds::zero())
            {
                auto failed = fail(request, RequestState::TimedOut, ProoflineError::timeout("Wall-clock ceiling exceeded during submission"));
                return std::unexpected(failed.error());
            }

            auto submitted = oracle_.submit(request.document_id, request.locator, std::min(cfg_.call_timeout, left));
            if (submitted)
                return submitted;

            if (!submitted.error().is_transient())
            {
                spdlog::error("oracle refused submission of {}: {}", request.document_id.to_hex(), submitted.error().what());
                auto failed = fail(request, RequestState::Rejected, submitted.error());
                return std::unexpected(failed.error());
            }

            ++failures;
            if (cfg_.backoff.exhausted(failures))
            {
                auto failed = fail(request, RequestState::Abandoned,
                                   ProoflineError::transient(std::format(
                                       "Oracle submission failed after {} attempts: {}", failures, submitted.error().what())));
                return std::unexpected(failed.error());
            }

            auto delay = std::min(cfg_.backoff.delay_for(failures), remaining(clock_.now(), deadline));
            spdlog::warn("oracle submission attempt {} failed ({}); retrying in {} ms",
                         failures, submitted.error().what(), delay.count());
            clock_.sleep_for(delay, token);
        }
    }

    Result<OracleReport> OracleClient::poll_until_final(AttestationRequest &request, Timestamp deadline, const CancellationToken &token)
    {
        std::size_t failures = 0;
        while (true)
        {
            if (token.is_cancelled())
            {
                auto failed = fail(request, RequestState::Abandoned, ProoflineError::cancelled("Attestation cancelled while polling"));
                return std::unexpected(failed.error());
            }

            auto now = clock_.now();
            auto left = remaining(now, deadline);
            if (left == std::chrono::milliseconds::zero())
            {
                spdlog::error("oracle request {} timed out after {} ms", request.request_id, cfg_.ceiling.count());
                auto failed = fail(request, RequestState::TimedOut,
                                   ProoflineError::timeout(std::format(
                                       "Oracle did not finalize request {} within {} ms", request.request_id, cfg_.ceiling.count())));
                return std::unexpected(failed.error());
            }

            token.take_wake();
            auto polled = oracle_.poll_status(request.request_id, std::min(cfg_.call_timeout, left));

            std::chrono::milliseconds delay = cfg_.poll_interval;
            if (!polled)
            {
                if (!polled.error().is_transient())
                {
                    spdlog::error("oracle request {} failed: {}", request.request_id, polled.error().what());
                    auto failed = fail(request, RequestState::Rejected, polled.error());
                    return std::unexpected(failed.error());
                }

                ++failures;
                if (cfg_.backoff.exhausted(failures))
                {
                    auto failed = fail(request, RequestState::Abandoned,
                                       ProoflineError::transient(std::format(
                                           "Polling request {} failed {} times in a row: {}",
                                           request.request_id, failures, polled.error().what())));
                    return std::unexpected(failed.error());
                }
                delay = cfg_.backoff.delay_for(failures);
                spdlog::warn("oracle poll {} for {} failed ({}); backing off {} ms",
                             failures, request.request_id, polled.error().what(), delay.count());
            }
            else if (polled->has_value() && (*polled)->finalized)
            {
                return std::move(**polled);
            }
            else
            {
                failures = 0;
            }

            clock_.sleep_for(std::min(delay, remaining(clock_.now(), deadline)), token);
        }
    }

    void OracleClient::track(const AttestationRequest &request, const CancellationToken &token)
    {
        std::lock_guard lock(mutex_);
        in_flight_.insert_or_assign(request.request_id, InFlight{token, request.state});
    }

    void OracleClient::untrack(const std::string &request_id)
    {
        std::lock_guard lock(mutex_);
        in_flight_.erase(request_id);
    }

    bool OracleClient::notify(const std::string &request_id)
    {
        std::lock_guard lock(mutex_);
        auto it = in_flight_.find(request_id);
        if (it == in_flight_.end())
            return false;
        spdlog::debug("push notification for oracle request {}", request_id);
        it->second.token.wake();
        return true;
    }

    bool OracleClient::cancel(const std::string &request_id)
    {
        std::lock_guard lock(mutex_);
        auto it = in_flight_.find(request_id);
        if (it == in_flight_.end())
            return false;
        spdlog::info("cancelling oracle request {}", request_id);
        it->second.token.cancel();
        return true;
    }

    std::optional<RequestState> OracleClient::state_of(const std::string &request_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = in_flight_.find(request_id);
        if (it == in_flight_.end())
            return std::nullopt;
        return it->second.state;
    }

} // namespace proofline
