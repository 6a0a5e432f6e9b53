/*
   Copyright 2022 The Driftgate Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "json_rpc_client.hpp"

#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <driftgate/common/log.hpp>
#include <driftgate/common/util.hpp>
#include <driftgate/rpc/error.hpp>

namespace driftgate::rpc {

namespace http = boost::beast::http;

constexpr const char* kUserAgent{"driftgate/" BOOST_BEAST_VERSION_STRING};

template<typename Stream>
static boost::asio::awaitable<http::response<http::string_body>> exchange(Stream& stream, const http::request<http::string_body>& request) {
    co_await http::async_write(stream, request, boost::asio::use_awaitable);
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> response;
    co_await http::async_read(stream, buffer, response, boost::asio::use_awaitable);
    co_return response;
}

JsonRpcClient::JsonRpcClient(RpcClientSettings settings)
    : settings_{std::move(settings)}, endpoint_{parse_url(settings_.url)}, ssl_context_{boost::asio::ssl::context::tls_client} {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(boost::asio::ssl::verify_peer);
}

boost::asio::awaitable<nlohmann::json> JsonRpcClient::call(const std::string& method, const nlohmann::json& params) {
    const auto id = next_id_++;
    DRIFTGATE_TRACE << "JsonRpcClient::call id: " << id << " method: " << method << "\n";
    const auto body = co_await post(make_request(id, method, params));
    co_return extract_result(body);
}

boost::asio::awaitable<FetchedTransaction> JsonRpcClient::get_transaction(const std::string& signature, const std::string& commitment) {
    const nlohmann::json config{{"encoding", "base64"}, {"commitment", commitment}, {"maxSupportedTransactionVersion", 0}};
    const auto params = nlohmann::json::array({signature, config});
    const auto result = co_await call("getTransaction", params);
    co_return parse_fetched_transaction(signature, result);
}

boost::asio::awaitable<std::string> JsonRpcClient::send_and_confirm(const Bytes& signed_transaction,
                                                                    const std::string& commitment,
                                                                    bool skip_preflight) {
    const nlohmann::json config{{"encoding", "base64"}, {"skipPreflight", skip_preflight}, {"preflightCommitment", commitment}};
    const auto params = nlohmann::json::array({base64_encode(signed_transaction), config});
    const auto result = co_await call("sendTransaction", params);
    if (!result.is_string()) {
        throw RpcError{"invalid sendTransaction result: " + result.dump()};
    }
    const auto signature = result.get<std::string>();
    DRIFTGATE_DEBUG << "JsonRpcClient: sent transaction signature: " << signature << "\n";

    co_await wait_for_confirmation(signature, commitment);
    co_return signature;
}

boost::asio::awaitable<void> JsonRpcClient::wait_for_confirmation(const std::string& signature, const std::string& commitment) {
    const auto deadline = std::chrono::steady_clock::now() + settings_.confirm_timeout;
    boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor};
    const nlohmann::json options{{"searchTransactionHistory", false}};

    while (true) {
        const auto params = nlohmann::json::array({nlohmann::json::array({signature}), options});
        const auto result = co_await call("getSignatureStatuses", params);
        const auto status = parse_signature_status(result);
        if (status) {
            if (status->err) {
                throw RpcError{"transaction " + signature + " failed: " + *status->err};
            }
            if (commitment_reached(status->confirmation_status, commitment)) {
                co_return;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw RpcError{"transaction " + signature + " not confirmed within " + std::to_string(settings_.confirm_timeout.count()) + " ms"};
        }
        timer.expires_after(settings_.poll_interval);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

boost::asio::awaitable<std::vector<SignatureInfo>> JsonRpcClient::get_signatures_for_address(
    const std::string& address, const std::optional<std::string>& before, std::size_t limit) {
    nlohmann::json config{{"limit", limit}, {"commitment", kCommitmentConfirmed}};
    if (before) {
        config["before"] = *before;
    }
    const auto params = nlohmann::json::array({address, config});
    const auto result = co_await call("getSignaturesForAddress", params);
    co_return parse_signatures(result);
}

boost::asio::awaitable<std::string> JsonRpcClient::post(std::string body) {
    auto executor = co_await boost::asio::this_coro::executor;

    http::request<http::string_body> request{http::verb::post, endpoint_.target, 11};
    request.set(http::field::host, endpoint_.host);
    request.set(http::field::user_agent, kUserAgent);
    request.set(http::field::content_type, "application/json");
    request.body() = std::move(body);
    request.prepare_payload();

    http::response<http::string_body> response;
    try {
        boost::asio::ip::tcp::resolver resolver{executor};
        const auto endpoints = co_await resolver.async_resolve(endpoint_.host, endpoint_.port, boost::asio::use_awaitable);

        if (endpoint_.tls) {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream{executor, ssl_context_};
            if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
                throw RpcError{"cannot set TLS server name " + endpoint_.host};
            }
            stream.set_verify_callback(boost::asio::ssl::host_name_verification{endpoint_.host});
            boost::beast::get_lowest_layer(stream).expires_after(settings_.request_timeout);
            co_await boost::beast::get_lowest_layer(stream).async_connect(endpoints, boost::asio::use_awaitable);
            co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
            response = co_await rpc::exchange(stream, request);

            boost::system::error_code ec;
            co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec && ec != boost::asio::ssl::error::stream_truncated) {
                DRIFTGATE_DEBUG << "JsonRpcClient: TLS shutdown: " << ec.message() << "\n";
            }
        } else {
            boost::beast::tcp_stream stream{executor};
            stream.expires_after(settings_.request_timeout);
            co_await stream.async_connect(endpoints, boost::asio::use_awaitable);
            response = co_await rpc::exchange(stream, request);

            boost::system::error_code ec;
            stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            if (ec && ec != boost::beast::errc::not_connected) {
                DRIFTGATE_DEBUG << "JsonRpcClient: socket shutdown: " << ec.message() << "\n";
            }
        }
    } catch (const boost::system::system_error& e) {
        throw RpcError{"http transport error: " + std::string{e.what()}};
    }

    if (response.result_int() / 100 != 2) {
        throw RpcError{"http status " + std::to_string(response.result_int()) + ": " + response.body()};
    }
    co_return std::move(response.body());
}

} // namespace driftgate::rpc
