#include "HttpUtils.h"
#include <boost/algorithm/string/split.hpp>

auto splitPath(const std::string &path) -> std::vector<std::string> {
    std::vector<std::string> segments;

    auto trimmed = path;
    if (!trimmed.empty() && trimmed.front() == '/') {
        trimmed.erase(0, 1);
    }

    boost::split(segments, trimmed, [](char character) { return character == '/'; });
    return segments;
}

auto percentDecode(const std::string &value) -> std::optional<std::string> {
    std::string result;
    result.reserve(value.size());

    auto hexValue = [](char character) -> int {
        if (character >= '0' && character <= '9') {
            return character - '0';
        }
        if (character >= 'a' && character <= 'f') {
            // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
            return character - 'a' + 10;
        }
        if (character >= 'A' && character <= 'F') {
            // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
            return character - 'A' + 10;
        }
        return -1;
    };

    for (std::size_t index = 0; index < value.size(); index++) {
        if (value[index] != '%') {
            result.push_back(value[index]);
            continue;
        }

        if (index + 2 >= value.size()) {
            return std::nullopt;
        }

        auto high = hexValue(value[index + 1]);
        auto low = hexValue(value[index + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }

        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        result.push_back(static_cast<char>(high * 16 + low));
        index += 2;
    }

    return result;
}

auto jsonResponse(SimpleWeb::StatusCode status, const nlohmann::json &body) -> sHttpResponse {
    sHttpResponse response;
    response.status = status;
    response.headers.emplace("Content-Type", "application/json");
    // Request text echoed into a body may not be valid UTF-8, it must never stop a response being built
    response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return response;
}

auto errorResponse(SimpleWeb::StatusCode status, const std::string &kind, const std::string &message) -> sHttpResponse {
    nlohmann::json body;
    body["error"]["kind"] = kind;
    body["error"]["message"] = message;
    return jsonResponse(status, body);
}
