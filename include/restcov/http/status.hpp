// status.hpp

#pragma once

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>


namespace restcov::http {
using status = boost::beast::http::status;
using field  = boost::beast::http::field;
} // namespace restcov::http
