// http.hpp

#pragma once

#include <restcov/http/request.hpp>
#include <restcov/http/response.hpp>
#include <restcov/http/status.hpp>
#include <restcov/http/url.hpp>
#include <restcov/http/verb.hpp>
