#include "proofline/http_client.hpp"
#include "proofline/json_fields.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <format>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace proofline
{

    using Json = nlohmann::json;

    namespace
    {
        ProoflineError unexpected_status(const std::string &what, const HttpResponse &res)
        {
            std::string reason;
            if (res.body.is_object())
            {
                if (auto it = res.body.find("error"); it != res.body.end() && it->is_string())
                    reason = it->get<std::string>();
            }
            auto message = std::format("{} returned HTTP {}{}", what, res.status, reason.empty() ? "" : ": " + reason);
            if (res.status == 404)
                return ProoflineError::not_found(message);
            return ProoflineError::validation(message);
        }
    } // namespace

    // ============================================================================
    // HttpEndpoint
    // ============================================================================

    Result<HttpEndpoint> HttpEndpoint::parse(const std::string &url)
    {
        constexpr std::string_view scheme = "http://";
        if (!url.starts_with(scheme))
        {
            return std::unexpected(ProoflineError::config(std::format("Endpoint '{}' must start with http://", url))
                                       .on_field("endpoint"));
        }

        std::string rest = url.substr(scheme.size());
        HttpEndpoint ep;
        auto slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        if (slash != std::string::npos)
        {
            ep.base_path = rest.substr(slash);
            while (!ep.base_path.empty() && ep.base_path.back() == '/')
                ep.base_path.pop_back();
        }

        auto colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            ep.host = authority.substr(0, colon);
            ep.port = authority.substr(colon + 1);
            bool numeric = !ep.port.empty() && std::all_of(ep.port.begin(), ep.port.end(),
                                                           [](unsigned char c) { return std::isdigit(c); });
            if (!numeric)
            {
                return std::unexpected(ProoflineError::config(std::format("Endpoint '{}' has an invalid port", url))
                                           .on_field("endpoint"));
            }
        }
        else
        {
            ep.host = authority;
        }

        if (ep.host.empty())
        {
            return std::unexpected(ProoflineError::config(std::format("Endpoint '{}' has no host", url)).on_field("endpoint"));
        }
        return ep;
    }

    std::string encode_path_segment(const std::string &segment)
    {
        std::string out;
        out.reserve(segment.size());
        for (unsigned char c : segment)
        {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
                out.push_back(static_cast<char>(c));
            else
                out += std::format("%{:02X}", static_cast<unsigned>(c));
        }
        return out;
    }

    // ============================================================================
    // HttpJsonClient
    // ============================================================================

    HttpJsonClient::HttpJsonClient(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

    Result<HttpResponse> HttpJsonClient::request(http::verb method,
                                                 const std::string &path,
                                                 const std::optional<Json> &body,
                                                 std::chrono::milliseconds timeout) const
    {
        const std::string target = endpoint_.base_path + path;

        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, endpoint_.host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::accept, "application/json");
        if (body)
        {
            req.set(http::field::content_type, "application/json");
            req.body() = body->dump();
        }
        req.prepare_payload();

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        beast::error_code failure;
        std::string failed_step;
        bool done = false;

        auto fail = [&](beast::error_code ec, const char *step) {
            failure = ec;
            failed_step = step;
            done = true;
        };

        resolver.async_resolve(endpoint_.host, endpoint_.port, [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec)
                return fail(ec, "resolve");
            stream.async_connect(results, [&](beast::error_code ec, const tcp::endpoint &) {
                if (ec)
                    return fail(ec, "connect");
                http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec)
                        return fail(ec, "write");
                    http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
                        if (ec)
                            return fail(ec, "read");
                        done = true;
                    });
                });
            });
        });

        ioc.run_for(timeout);
        if (!done)
        {
            resolver.cancel();
            stream.cancel();
            ioc.run();
            return std::unexpected(ProoflineError::transient(std::format(
                "{} {} timed out after {} ms", std::string(http::to_string(method)), target, timeout.count())));
        }

        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

        if (failure)
        {
            return std::unexpected(ProoflineError::transient(std::format(
                "{} {} failed during {}: {}", std::string(http::to_string(method)), target, failed_step, failure.message())));
        }

        HttpResponse out;
        out.status = res.result_int();
        if (out.status >= 500)
        {
            return std::unexpected(ProoflineError::transient(std::format(
                "{} {} returned HTTP {}", std::string(http::to_string(method)), target, out.status)));
        }

        if (!res.body().empty())
        {
            out.body = Json::parse(res.body(), nullptr, false);
            if (out.body.is_discarded())
            {
                return std::unexpected(ProoflineError::validation(std::format(
                    "{} {} returned a body that is not JSON", std::string(http::to_string(method)), target)));
            }
        }
        return out;
    }

    // ============================================================================
    // HttpOracle
    // ============================================================================

    HttpOracle::HttpOracle(HttpEndpoint endpoint) : client_(std::move(endpoint)) {}

    Result<std::string> HttpOracle::submit(const Digest &document_id,
                                           const ContentLocator &locator,
                                           std::chrono::milliseconds timeout)
    {
        Json body = {{"document_id", document_id.to_hex()}, {"locator", locator.to_json()}};
        auto res = client_.request(http::verb::post, "/v1/attestations", body, timeout);
        if (!res)
            return std::unexpected(res.error());
        if (res->status != 200 && res->status != 201 && res->status != 202)
            return std::unexpected(unexpected_status("oracle submit", *res));

        auto it = res->body.is_object() ? res->body.find("request_id") : res->body.end();
        if (!res->body.is_object() || it == res->body.end() || !it->is_string() || it->get<std::string>().empty())
        {
            return std::unexpected(ProoflineError::validation("Oracle submit response carries no request_id")
                                       .on_field("request_id"));
        }
        return it->get<std::string>();
    }

    Result<std::optional<OracleReport>> HttpOracle::poll_status(const std::string &request_id,
                                                                std::chrono::milliseconds timeout)
    {
        auto res = client_.request(http::verb::get, "/v1/attestations/" + encode_path_segment(request_id), std::nullopt, timeout);
        if (!res)
            return std::unexpected(res.error());
        if (res->status != 200)
            return std::unexpected(unexpected_status("oracle status", *res));

        const Json &j = res->body;
        if (!j.is_object())
            return std::unexpected(ProoflineError::validation("Oracle status response is not a JSON object").on_field("state"));

        auto state = json::require_string(j, "state");
        if (!state)
            return std::unexpected(state.error());
        if (*state == "pending")
            return std::optional<OracleReport>();

        if (*state == "rejected")
        {
            std::string reason = "no reason given";
            if (j.contains("reason"))
            {
                auto given = json::require_string(j, "reason");
                if (!given)
                    return std::unexpected(given.error());
                reason = *given;
            }
            return std::unexpected(ProoflineError::validation("Oracle rejected the request: " + reason).on_field("state"));
        }

        if (*state != "finalized")
        {
            return std::unexpected(ProoflineError::validation(std::format("Unknown oracle request state '{}'", *state))
                                       .on_field("state"));
        }

        auto report_it = j.find("report");
        if (report_it == j.end())
            return std::unexpected(ProoflineError::validation("Finalized oracle response carries no report").on_field("report"));
        auto report = OracleReport::from_json(*report_it);
        if (!report)
            return std::unexpected(report.error());
        return std::optional<OracleReport>(std::move(*report));
    }

    // ============================================================================
    // HttpLedger
    // ============================================================================

    HttpLedger::HttpLedger(std::string chain_id, HttpEndpoint endpoint)
        : chain_id_(std::move(chain_id)), client_(std::move(endpoint))
    {
    }

    Result<TransactionStatus> HttpLedger::get_transaction_status(const std::string &transaction_ref,
                                                                 std::chrono::milliseconds timeout)
    {
        auto path = std::format("/v1/chains/{}/tx/{}", encode_path_segment(chain_id_), encode_path_segment(transaction_ref));
        auto res = client_.request(http::verb::get, path, std::nullopt, timeout);
        if (!res)
            return std::unexpected(res.error());
        if (res->status == 404)
            return TransactionStatus{};
        if (res->status != 200)
            return std::unexpected(unexpected_status("ledger " + chain_id_, *res));

        auto status = TransactionStatus::from_json(res->body);
        if (!status)
            spdlog::warn("ledger {} returned a malformed status for {}: {}", chain_id_, transaction_ref, status.error().what());
        return status;
    }

} // namespace proofline
