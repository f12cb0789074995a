#include "RouteTable.h"
#include "HttpUtils.h"
#include <algorithm>
#include <echo_service/Errors.h>
#include <set>
#include <utility>

void RouteTable::add(const std::string &method, const std::string &pattern, RouteHandler handler) {
    if (method.empty() || !std::all_of(method.begin(), method.end(), [](char character) {
        return character >= 'A' && character <= 'Z';
    })) {
        throw eConstructionError("Invalid route method '" + method + "'");
    }

    if (pattern.empty() || pattern.front() != '/') {
        throw eConstructionError("Route pattern '" + pattern + "' must start with /");
    }

    if (!handler) {
        throw eConstructionError("Route " + method + " " + pattern + " has no handler");
    }

    sRoute route;
    route.method = method;
    route.pattern = pattern;
    route.handler = std::move(handler);

    std::set<std::string> parameterNames;
    for (const auto &segment : splitPath(pattern)) {
        auto opens = std::count(segment.begin(), segment.end(), '{');
        auto closes = std::count(segment.begin(), segment.end(), '}');

        if (opens == 0 && closes == 0) {
            route.segments.push_back({segment, false});
            route.literalCount++;
            continue;
        }

        if (opens != 1 || closes != 1 || segment.size() < 3 || segment.front() != '{' || segment.back() != '}') {
            throw eConstructionError("Route pattern '" + pattern + "' has a malformed parameter segment '" + segment + "'");
        }

        auto name = segment.substr(1, segment.size() - 2);
        if (!parameterNames.insert(name).second) {
            throw eConstructionError("Route pattern '" + pattern + "' repeats parameter '" + name + "'");
        }

        route.segments.push_back({name, true});
    }

    for (const auto &existing : vRoutes) {
        if (existing.method == route.method && existing.pattern == route.pattern) {
            throw eConstructionError("Route " + method + " " + pattern + " is already registered");
        }
    }

    vRoutes.push_back(std::move(route));
}
