//
// Transport level request and response values passed between the HTTP server and the router
//

#ifndef ECHO_SERVICE_HTTPTYPES_H
#define ECHO_SERVICE_HTTPTYPES_H

#include <functional>
#include <map>
#include <status_code.hpp>
#include <string>
#include <utility.hpp>

struct sHttpRequest {
    std::string method;
    // Raw path, still percent encoded
    std::string path;
};

struct sHttpResponse {
    SimpleWeb::StatusCode status = SimpleWeb::StatusCode::success_ok;
    SimpleWeb::CaseInsensitiveMultimap headers;
    std::string body;
};

// Percent decoded values of the {name} segments of the matched route
using RouteParams = std::map<std::string, std::string>;

using RouteHandler = std::function<sHttpResponse(const sHttpRequest &, const RouteParams &)>;

#endif //ECHO_SERVICE_HTTPTYPES_H
