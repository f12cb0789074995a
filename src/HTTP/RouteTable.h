//
// Ordered (method, pattern) -> handler table. Filled while wiring, read only once serving.
//

#ifndef ECHO_SERVICE_ROUTETABLE_H
#define ECHO_SERVICE_ROUTETABLE_H

#include "HttpTypes.h"
#include <cstddef>
#include <string>
#include <vector>

struct sRouteSegment {
    // Literal text, or the parameter name when isParameter is set
    std::string value;
    bool isParameter = false;
};

struct sRoute {
    std::string method;
    std::string pattern;
    std::vector<sRouteSegment> segments;
    std::size_t literalCount = 0;
    RouteHandler handler;
};

class RouteTable {
public:
    // Patterns look like "/echo/{message}". A parameter must fill a whole segment.
    // Throws eConstructionError for a malformed method or pattern
    void add(const std::string &method, const std::string &pattern, RouteHandler handler);

    [[nodiscard]] auto routes() const -> const std::vector<sRoute> & {
        return vRoutes;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return vRoutes.size();
    }

private:
    std::vector<sRoute> vRoutes;
};

#endif //ECHO_SERVICE_ROUTETABLE_H
