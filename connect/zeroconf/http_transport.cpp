/***
    This file is part of zeroconnect
    Copyright (C) 2024-2025  Johannes Pohl

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
***/

// prototype/interface header file
#include "http_transport.hpp"

// local headers
#include "common/utils/string_utils.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

// standard headers
#include <algorithm>
#include <optional>


using namespace std;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

static constexpr auto LOG_TAG = "HttpTransport";


namespace zeroconf
{

namespace
{

zeroconnect::ErrorCode toErrorCode(const boost::system::error_code& ec, const HttpRequest& request)
{
    string detail = request.host + ":" + to_string(request.port) + ", " + ec.message();
    if (ec == boost::asio::error::connection_refused)
        return {ConnectErrc::connection_refused, detail};
    if ((ec == beast::error::timeout) || (ec == boost::asio::error::timed_out))
        return {ConnectErrc::timeout, detail};
    return {ConnectErrc::transport_error, detail};
}

} // namespace


std::string formEncode(const FormFields& fields)
{
    string result;
    for (const auto& [key, value] : fields)
    {
        if (!result.empty())
            result += "&";
        result += utils::string::urlEncode(key) + "=" + utils::string::urlEncode(value);
    }
    return result;
}


zeroconnect::ErrorOr<HttpResponse> BeastHttpTransport::send(const HttpRequest& request)
{
    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    http::request<http::string_body> req{(request.method == HttpRequest::Method::post) ? http::verb::post : http::verb::get, request.target, 11};
    req.set(http::field::host, request.host + ":" + to_string(request.port));
    req.set(http::field::user_agent, "zeroconnect");
    req.set(http::field::connection, "close");
    req.set(http::field::content_type, "application/x-www-form-urlencoded");
    if (request.method == HttpRequest::Method::post)
    {
        req.body() = request.body;
        req.prepare_payload();
    }

    LOG(TRACE, LOG_TAG) << (request.method == HttpRequest::Method::post ? "POST " : "GET ") << request.host << ":" << request.port << request.target
                        << "\n";

    std::optional<boost::system::error_code> result;
    auto deadline = std::chrono::steady_clock::now() + request.total_timeout;

    auto on_read = [&](beast::error_code ec, std::size_t /*bytes_transferred*/) { result = ec; };

    auto on_write = [&](beast::error_code ec, std::size_t /*bytes_transferred*/)
    {
        if (ec)
        {
            result = ec;
            return;
        }
        http::async_read(stream, buffer, res, on_read);
    };

    auto on_connect = [&](beast::error_code ec, const tcp::endpoint& /*endpoint*/)
    {
        if (ec)
        {
            result = ec;
            return;
        }
        stream.expires_at(deadline);
        http::async_write(stream, req, on_write);
    };

    resolver.async_resolve(request.host, to_string(request.port), [&](beast::error_code ec, const tcp::resolver::results_type& results)
    {
        if (ec)
        {
            result = ec;
            return;
        }
        stream.expires_after(std::min(request.connect_timeout, request.total_timeout));
        stream.async_connect(results, on_connect);
    });

    ioc.run_for(request.total_timeout);
    if (!result.has_value())
    {
        beast::error_code ignored;
        stream.socket().close(ignored);
        return zeroconnect::ErrorCode(ConnectErrc::timeout, request.host + ":" + to_string(request.port) + ", no response within " +
                                                                to_string(request.total_timeout.count()) + " ms");
    }

    if (*result && (*result != http::error::end_of_stream))
    {
        LOG(DEBUG, LOG_TAG) << "Request to " << request.host << ":" << request.port << " failed: " << result->message() << "\n";
        return toErrorCode(*result, request);
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    HttpResponse response;
    response.status = res.result_int();
    response.content_type = std::string(res[http::field::content_type]);
    response.body = std::move(res.body());
    LOG(TRACE, LOG_TAG) << "Response: " << response.status << ", content type: '" << response.content_type << "', body: " << response.body << "\n";
    return response;
}

} // namespace zeroconf
