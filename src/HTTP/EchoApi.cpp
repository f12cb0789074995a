#include "EchoApi.h"
#include "HttpUtils.h"
#include <nlohmann/json.hpp>

void EchoApi(const std::string &path, RouteTable &routes, const std::shared_ptr<IEchoService> &echoService) {
    // Get      -> Echo the message in the final path segment back to the caller
    routes.add("GET", path + "{message}", [echoService](const sHttpRequest & /*request*/, const RouteParams &params) {
        auto result = echoService->execute(sEchoRequest{params.at("message")});

        nlohmann::json body;
        body["message"] = result.message;
        body["count"] = result.count;

        return jsonResponse(SimpleWeb::StatusCode::success_ok, body);
    });
}
