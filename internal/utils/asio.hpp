#ifndef UTILS_ASIO_HPP
#define UTILS_ASIO_HPP

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/http.hpp>

namespace net = boost::asio;
using boost::asio::ip::tcp;
using boost::system::error_code;

namespace beast = boost::beast;
namespace http = beast::http;

#endif //UTILS_ASIO_HPP
