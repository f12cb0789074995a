//
// Maps requests onto the route table and turns handler outcomes into responses
//

#ifndef ECHO_SERVICE_ROUTER_H
#define ECHO_SERVICE_ROUTER_H

#include "HttpTypes.h"
#include "RouteTable.h"
#include <echo_service/Errors.h>
#include <memory>
#include <optional>

struct sRouteMatch {
    const sRoute *route = nullptr;
    RouteParams params;
};

class Router {
public:
    explicit Router(std::shared_ptr<const RouteTable> routeTable);

    // Never throws. Unmatched requests get a 404, handler failures get the mapped error response
    auto dispatch(const sHttpRequest &request) const -> sHttpResponse;

    // Picks the route with the most literal segments among those matching method and path.
    // Ties go to the route registered first
    [[nodiscard]] auto match(const std::string &method, const std::string &path) const -> std::optional<sRouteMatch>;

    // The fixed domain error -> status table
    static auto statusFor(DomainErrorKind kind) -> SimpleWeb::StatusCode;

private:
    std::shared_ptr<const RouteTable> routeTable;
};

#endif //ECHO_SERVICE_ROUTER_H
