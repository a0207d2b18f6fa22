#pragma once

#include "collaborators.hpp"
#include "types.hpp"
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace proofline
{

    struct HttpEndpoint
    {
        std::string host;
        std::string port{"80"};
        std::string base_path; // no trailing slash

        /** Parse `http://host[:port][/base]`; https is not supported */
        static Result<HttpEndpoint> parse(const std::string &url);
    };

    struct HttpResponse
    {
        unsigned status{0};
        nlohmann::json body;
    };

    /** Percent-encode one path segment */
    std::string encode_path_segment(const std::string &segment);

    /**
     * Minimal blocking JSON-over-HTTP/1.1 client (Boost.Beast).
     *
     * Every call carries its own deadline. Connection failures, timeouts
     * and 5xx responses are TransientNetwork; other non-2xx responses are
     * returned to the caller to interpret.
     */
    class HttpJsonClient
    {
    public:
        explicit HttpJsonClient(HttpEndpoint endpoint);

        Result<HttpResponse> request(boost::beast::http::verb method,
                                     const std::string &path,
                                     const std::optional<nlohmann::json> &body,
                                     std::chrono::milliseconds timeout) const;

        const HttpEndpoint &endpoint() const { return endpoint_; }

    private:
        HttpEndpoint endpoint_;
    };

    /**
     * Oracle reached over HTTP.
     *   POST {base}/v1/attestations        {"document_id", "locator"} -> {"request_id"}
     *   GET  {base}/v1/attestations/{id}   -> {"state": "pending" | "finalized" | "rejected", "report"?, "reason"?}
     */
    class HttpOracle : public Oracle
    {
    public:
        explicit HttpOracle(HttpEndpoint endpoint);

        Result<std::string> submit(const Digest &document_id,
                                   const ContentLocator &locator,
                                   std::chrono::milliseconds timeout) override;

        Result<std::optional<OracleReport>> poll_status(const std::string &request_id,
                                                        std::chrono::milliseconds timeout) override;

    private:
        HttpJsonClient client_;
    };

    /**
     * Ledger gateway reached over HTTP.
     *   GET {base}/v1/chains/{chain}/tx/{ref} -> {"found", "block_height", "confirmation_count", "reverted"}
     * A 404 means the transaction is not (yet) known.
     */
    class HttpLedger : public Ledger
    {
    public:
        HttpLedger(std::string chain_id, HttpEndpoint endpoint);

        std::string chain_id() const override { return chain_id_; }

        Result<TransactionStatus> get_transaction_status(const std::string &transaction_ref,
                                                         std::chrono::milliseconds timeout) override;

    private:
        std::string chain_id_;
        HttpJsonClient client_;
    };

} // namespace proofline
