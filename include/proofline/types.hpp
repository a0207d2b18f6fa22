#pragma once

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>

namespace proofline
{

    /**
     * Error kinds surfaced by the engine.
     *
     * TransientNetwork is absorbed by retry loops and only escapes once the
     * attempt budget is exhausted. IntegrityFault is never retried.
     */
    enum class ErrorCode
    {
        IntegrityFault,
        TransientNetwork,
        ValidationError,
        QuorumUnreachable,
        Timeout,
        Cancelled,
        ConfigError,
        CryptoError,
        StorageError,
        NotFound,
        InvalidInput,
        IOError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::IntegrityFault:
            return "IntegrityFault";
        case ErrorCode::TransientNetwork:
            return "TransientNetworkError";
        case ErrorCode::ValidationError:
            return "ValidationError";
        case ErrorCode::QuorumUnreachable:
            return "QuorumUnreachableError";
        case ErrorCode::Timeout:
            return "TimeoutError";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

    /**
     * Proofline error with code, message and optional structured detail.
     *
     * `stage` names the pipeline stage that produced the error (e.g. "oracle",
     * "ledger:eth-mainnet"), `field` the offending field, and `expected` /
     * `actual` the compared values where a comparison failed.
     */
    class ProoflineError : public std::runtime_error
    {
    public:
        ErrorCode code;
        std::string stage;
        std::string field;
        std::optional<std::string> expected;
        std::optional<std::string> actual;

        ProoflineError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        ProoflineError &at_stage(std::string s)
        {
            stage = std::move(s);
            return *this;
        }

        ProoflineError &on_field(std::string f)
        {
            field = std::move(f);
            return *this;
        }

        ProoflineError &compared(std::string exp, std::string act)
        {
            expected = std::move(exp);
            actual = std::move(act);
            return *this;
        }

        bool is_transient() const { return code == ErrorCode::TransientNetwork; }

        /** One-line description including stage and field, for logs and CLI output */
        std::string describe() const;

        static ProoflineError integrity(const std::string &msg)
        {
            return ProoflineError(ErrorCode::IntegrityFault, msg);
        }

        static ProoflineError transient(const std::string &msg)
        {
            return ProoflineError(ErrorCode::TransientNetwork, msg);
        }

        static ProoflineError validation(const std::string &msg)
        {
            return ProoflineError(ErrorCode::ValidationError, msg);
        }

        static ProoflineError quorum_unreachable(const std::string &msg)
        {
            return ProoflineError(ErrorCode::QuorumUnreachable, msg);
        }

        static ProoflineError timeout(const std::string &msg)
        {
            return ProoflineError(ErrorCode::Timeout, msg);
        }

        static ProoflineError cancelled(const std::string &msg)
        {
            return ProoflineError(ErrorCode::Cancelled, msg);
        }

        static ProoflineError config(const std::string &msg)
        {
            return ProoflineError(ErrorCode::ConfigError, msg);
        }

        static ProoflineError crypto(const std::string &msg)
        {
            return ProoflineError(ErrorCode::CryptoError, msg);
        }

        static ProoflineError storage(const std::string &msg)
        {
            return ProoflineError(ErrorCode::StorageError, msg);
        }

        static ProoflineError not_found(const std::string &msg)
        {
            return ProoflineError(ErrorCode::NotFound, msg);
        }

        static ProoflineError invalid_input(const std::string &msg)
        {
            return ProoflineError(ErrorCode::InvalidInput, msg);
        }

        static ProoflineError io(const std::string &msg)
        {
            return ProoflineError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, ProoflineError>;

} // namespace proofline
