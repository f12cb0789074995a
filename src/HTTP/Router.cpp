#include "Router.h"
#include "../Lib/GeneralUtils.h"
#include "HttpUtils.h"
#include <utility>

Router::Router(std::shared_ptr<const RouteTable> routeTable) : routeTable(std::move(routeTable)) {}

auto Router::dispatch(const sHttpRequest &request) const -> sHttpResponse {
    auto routeMatch = match(request.method, request.path);
    if (!routeMatch) {
        return errorResponse(
                SimpleWeb::StatusCode::client_error_not_found,
                domainErrorKindName(DomainErrorKind::NotFound),
                "No route for " + request.method + " " + request.path
        );
    }

    try {
        return routeMatch->route->handler(request, routeMatch->params);
    } catch (eDomainError &e) {
        return errorResponse(statusFor(e.kind()), domainErrorKindName(e.kind()), e.what());
    } catch (std::exception &e) {
        dumpExceptions(e);

        // Internal details stay in the log
        return errorResponse(
                SimpleWeb::StatusCode::server_error_internal_server_error,
                "internal",
                "Internal server error"
        );
    }
}

auto Router::match(const std::string &method, const std::string &path) const -> std::optional<sRouteMatch> {
    // Decode every segment up front, a malformed escape anywhere means nothing can match
    std::vector<std::string> segments;
    for (const auto &segment : splitPath(path)) {
        auto decoded = percentDecode(segment);
        if (!decoded) {
            return std::nullopt;
        }
        segments.push_back(*decoded);
    }

    std::optional<sRouteMatch> best;

    for (const auto &route : routeTable->routes()) {
        if (route.method != method || route.segments.size() != segments.size()) {
            continue;
        }

        if (best && best->route->literalCount >= route.literalCount) {
            continue;
        }

        sRouteMatch candidate;
        candidate.route = &route;

        bool matched = true;
        for (std::size_t index = 0; index < segments.size(); index++) {
            const auto &segment = route.segments[index];
            if (segment.isParameter) {
                candidate.params[segment.value] = segments[index];
            } else if (segment.value != segments[index]) {
                matched = false;
                break;
            }
        }

        if (matched) {
            best = std::move(candidate);
        }
    }

    return best;
}

auto Router::statusFor(DomainErrorKind kind) -> SimpleWeb::StatusCode {
    switch (kind) {
        case DomainErrorKind::InvalidInput:
            return SimpleWeb::StatusCode::client_error_bad_request;
        case DomainErrorKind::NotFound:
            return SimpleWeb::StatusCode::client_error_not_found;
        case DomainErrorKind::Unavailable:
            return SimpleWeb::StatusCode::server_error_service_unavailable;
    }

    return SimpleWeb::StatusCode::server_error_internal_server_error;
}
