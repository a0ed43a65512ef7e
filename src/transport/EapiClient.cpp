#include "transport/EapiClient.hpp"

#include "common/Logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <utility>

namespace netprov::transport {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

std::string basicAuthHeader(const std::string& sUser, const std::string& sPassword) {
  std::string sPlain = sUser + ":" + sPassword;
  std::vector<unsigned char> vOut(4 * ((sPlain.size() + 2) / 3) + 1);
  const int iLen = EVP_EncodeBlock(vOut.data(),
                                   reinterpret_cast<const unsigned char*>(sPlain.data()),
                                   static_cast<int>(sPlain.size()));
  OPENSSL_cleanse(sPlain.data(), sPlain.size());
  std::string sHeader = "Basic " + std::string(reinterpret_cast<char*>(vOut.data()),
                                               static_cast<size_t>(iLen));
  OPENSSL_cleanse(vOut.data(), vOut.size());
  return sHeader;
}

[[noreturn]] void throwFor(const beast::error_code& ec, const std::string& sStep,
                           const std::string& sHost) {
  if (ec == beast::error::timeout) {
    throw EapiError(EapiError::Category::Timeout, sStep + " " + sHost + " timed out");
  }
  throw EapiError(EapiError::Category::Network, sStep + " " + sHost + ": " + ec.message());
}

/// Run one async operation to completion on ioc. A tcp_stream expiry
/// completes the operation with beast::error::timeout.
template <typename Initiate>
beast::error_code runOp(net::io_context& ioc, Initiate&& fnInitiate) {
  beast::error_code ecOut;
  std::forward<Initiate>(fnInitiate)([&ecOut](beast::error_code ec, auto&&...) { ecOut = ec; });
  ioc.restart();
  ioc.run();
  return ecOut;
}

template <typename Stream>
http::response<http::string_body> exchange(net::io_context& ioc, Stream& stream,
                                           http::request<http::string_body>& req,
                                           std::chrono::seconds durTimeout,
                                           const std::string& sHost) {
  beast::get_lowest_layer(stream).expires_after(durTimeout);
  auto ec = runOp(ioc, [&](auto&& fnDone) {
    http::async_write(stream, req, std::forward<decltype(fnDone)>(fnDone));
  });
  if (ec) throwFor(ec, "send to", sHost);

  beast::flat_buffer fbBuffer;
  http::response<http::string_body> res;
  beast::get_lowest_layer(stream).expires_after(durTimeout);
  ec = runOp(ioc, [&](auto&& fnDone) {
    http::async_read(stream, fbBuffer, res, std::forward<decltype(fnDone)>(fnDone));
  });
  if (ec) throwFor(ec, "read from", sHost);
  return res;
}

}  // namespace

EapiClient::EapiClient(EapiEndpoint epEndpoint)
    : _epEndpoint(std::move(epEndpoint)),
      _sAuthHeader(basicAuthHeader(_epEndpoint.sUsername, _epEndpoint.sPassword)) {
  OPENSSL_cleanse(_epEndpoint.sPassword.data(), _epEndpoint.sPassword.size());
  _epEndpoint.sPassword.clear();
}

EapiClient::~EapiClient() {
  OPENSSL_cleanse(_sAuthHeader.data(), _sAuthHeader.size());
}

nlohmann::json EapiClient::runCmds(const std::vector<std::string>& vCmds,
                                   const std::string& sFormat) {
  const std::string sId = "netprov-" + std::to_string(_uNextId++);
  std::string sRequest;
  try {
    nlohmann::json jRequest = {
        {"jsonrpc", "2.0"},
        {"method", "runCmds"},
        {"params", {{"version", 1}, {"cmds", vCmds}, {"format", sFormat}}},
        {"id", sId},
    };
    sRequest = jRequest.dump();
  } catch (const nlohmann::json::exception& ex) {
    // dump() rejects bytes that are not valid UTF-8.
    throw EapiError(EapiError::Category::Protocol,
                    std::string("Cannot encode eAPI request: ") + ex.what());
  }

  return parseResponse(post(sRequest));
}

nlohmann::json EapiClient::parseResponse(const std::string& sBody) {
  nlohmann::json jResponse;
  try {
    jResponse = nlohmann::json::parse(sBody);
  } catch (const nlohmann::json::parse_error& ex) {
    throw EapiError(EapiError::Category::Protocol,
                    std::string("Malformed eAPI response: ") + ex.what());
  }
  if (!jResponse.is_object()) {
    throw EapiError(EapiError::Category::Protocol, "eAPI response is not a JSON object");
  }

  if (jResponse.contains("error")) {
    std::string sMsg;
    try {
      const auto& jError = jResponse["error"];
      sMsg = jError.value("message", "eAPI command failed");
      if (jError.contains("data") && jError["data"].is_array()) {
        for (const auto& jItem : jError["data"]) {
          if (jItem.is_object() && jItem.contains("errors")) {
            for (const auto& jErr : jItem["errors"]) {
              sMsg += "; " + jErr.get<std::string>();
            }
          }
        }
      }
    } catch (const nlohmann::json::exception& ex) {
      throw EapiError(EapiError::Category::Protocol,
                      std::string("Malformed eAPI error payload: ") + ex.what());
    }
    throw EapiError(EapiError::Category::Command, sMsg);
  }

  if (!jResponse.contains("result") || !jResponse["result"].is_array()) {
    throw EapiError(EapiError::Category::Protocol, "eAPI response has no result array");
  }
  return jResponse["result"];
}

std::string EapiClient::post(const std::string& sBody) {
  const auto& sHost = _epEndpoint.sHost;
  net::io_context ioc;

  tcp::resolver resolver(ioc);
  tcp::resolver::results_type results;
  beast::error_code ecResolve;
  bool bResolved = false;
  resolver.async_resolve(sHost, std::to_string(_epEndpoint.uPort),
                         [&](beast::error_code ec, tcp::resolver::results_type r) {
                           ecResolve = ec;
                           results = std::move(r);
                           bResolved = true;
                         });
  ioc.run_for(_epEndpoint.durConnectTimeout);
  if (!bResolved) {
    resolver.cancel();
    ioc.restart();
    ioc.run();
    throw EapiError(EapiError::Category::Timeout, "resolve " + sHost + " timed out");
  }
  if (ecResolve) throwFor(ecResolve, "resolve", sHost);

  http::request<http::string_body> req{http::verb::post, "/command-api", 11};
  req.set(http::field::host, sHost);
  req.set(http::field::user_agent, "netprov");
  req.set(http::field::content_type, "application/json-rpc");
  req.set(http::field::authorization, _sAuthHeader);
  req.body() = sBody;
  req.prepare_payload();

  http::response<http::string_body> res;
  auto spLog = common::Logger::get();

  if (_epEndpoint.bTls) {
    ssl::context ctx(ssl::context::tls_client);
    if (_epEndpoint.bVerifyTls) {
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(ssl::verify_peer);
    } else {
      ctx.set_verify_mode(ssl::verify_none);
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), sHost.c_str())) {
      throw EapiError(EapiError::Category::Network, "cannot set SNI host name " + sHost);
    }
    if (_epEndpoint.bVerifyTls) {
      stream.set_verify_callback(ssl::host_name_verification(sHost));
    }

    beast::get_lowest_layer(stream).expires_after(_epEndpoint.durConnectTimeout);
    auto ec = runOp(ioc, [&](auto&& fnDone) {
      beast::get_lowest_layer(stream).async_connect(results,
                                                    std::forward<decltype(fnDone)>(fnDone));
    });
    if (ec) throwFor(ec, "connect to", sHost);

    beast::get_lowest_layer(stream).expires_after(_epEndpoint.durConnectTimeout);
    ec = runOp(ioc, [&](auto&& fnDone) {
      stream.async_handshake(ssl::stream_base::client, std::forward<decltype(fnDone)>(fnDone));
    });
    if (ec) throwFor(ec, "TLS handshake with", sHost);

    res = exchange(ioc, stream, req, _epEndpoint.durRequestTimeout, sHost);

    beast::get_lowest_layer(stream).expires_after(_epEndpoint.durConnectTimeout);
    ec = runOp(ioc, [&](auto&& fnDone) {
      stream.async_shutdown(std::forward<decltype(fnDone)>(fnDone));
    });
    if (ec && ec != net::ssl::error::stream_truncated) {
      spLog->debug("TLS shutdown with {}: {}", sHost, ec.message());
    }
  } else {
    beast::tcp_stream stream(ioc);
    stream.expires_after(_epEndpoint.durConnectTimeout);
    auto ec = runOp(ioc, [&](auto&& fnDone) {
      stream.async_connect(results, std::forward<decltype(fnDone)>(fnDone));
    });
    if (ec) throwFor(ec, "connect to", sHost);

    res = exchange(ioc, stream, req, _epEndpoint.durRequestTimeout, sHost);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      spLog->debug("Socket shutdown with {}: {}", sHost, ec.message());
    }
  }

  const auto iStatus = res.result_int();
  if (iStatus == 401 || iStatus == 403) {
    throw EapiError(EapiError::Category::Auth,
                    "eAPI on " + sHost + " rejected credentials (HTTP " +
                        std::to_string(iStatus) + ")");
  }
  if (iStatus != 200) {
    throw EapiError(EapiError::Category::Protocol,
                    "eAPI on " + sHost + " returned HTTP " + std::to_string(iStatus));
  }
  return res.body();
}

}  // namespace netprov::transport
