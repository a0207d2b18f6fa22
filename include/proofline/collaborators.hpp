#pragma once

#include "crypto.hpp"
#include "model.hpp"
#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace proofline
{

    /**
     * Content-addressed storage the engine reads from. Uploads are not its concern.
     */
    class ContentStore
    {
    public:
        virtual ~ContentStore() = default;

        virtual Result<crypto::Bytes> retrieve(const ContentLocator &locator) = 0;

        /** Digest the store itself reports for the bytes behind `locator` */
        virtual Result<Digest> locator_digest(const ContentLocator &locator) = 0;
    };

    /**
     * External attestation oracle.
     *
     * Implementations report timeouts and 5xx-class failures as
     * ErrorCode::TransientNetwork so callers can retry them; any other error
     * is terminal for the call.
     */
    class Oracle
    {
    public:
        virtual ~Oracle() = default;

        /** Submit `document_id` for attestation; returns the oracle-assigned request id */
        virtual Result<std::string> submit(const Digest &document_id,
                                           const ContentLocator &locator,
                                           std::chrono::milliseconds timeout) = 0;

        /** Current report for `request_id`, or nullopt while the oracle is still working */
        virtual Result<std::optional<OracleReport>> poll_status(const std::string &request_id,
                                                                std::chrono::milliseconds timeout) = 0;
    };

    /**
     * One target ledger. Same transient-error convention as Oracle.
     */
    class Ledger
    {
    public:
        virtual ~Ledger() = default;

        virtual std::string chain_id() const = 0;

        virtual Result<TransactionStatus> get_transaction_status(const std::string &transaction_ref,
                                                                 std::chrono::milliseconds timeout) = 0;
    };

} // namespace proofline
