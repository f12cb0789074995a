#include "EchoService.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <echo_service/Errors.h>
#include <cstdint>
#include <utility>

namespace {
// Returns false for truncated sequences, overlong encodings, surrogates and values past U+10FFFF
auto isValidUtf8(const std::string &value) -> bool {
    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    std::size_t index = 0;
    while (index < value.size()) {
        auto lead = static_cast<uint8_t>(value[index]);

        std::size_t length = 0;
        uint32_t codePoint = 0;
        if (lead < 0x80) {
            length = 1;
            codePoint = lead;
        } else if ((lead & 0xE0U) == 0xC0) {
            length = 2;
            codePoint = lead & 0x1FU;
        } else if ((lead & 0xF0U) == 0xE0) {
            length = 3;
            codePoint = lead & 0x0FU;
        } else if ((lead & 0xF8U) == 0xF0) {
            length = 4;
            codePoint = lead & 0x07U;
        } else {
            return false;
        }

        if (index + length > value.size()) {
            return false;
        }

        for (std::size_t i = 1; i < length; i++) {
            auto next = static_cast<uint8_t>(value[index + i]);
            if ((next & 0xC0U) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6U) | (next & 0x3FU);
        }

        if ((length == 2 && codePoint < 0x80) || (length == 3 && codePoint < 0x800) ||
            (length == 4 && codePoint < 0x10000) || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }

        index += length;
    }
    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

    return true;
}
} // namespace

EchoService::EchoService(std::shared_ptr<IDataStore> dataStore) : dataStore(std::move(dataStore)) {}

auto EchoService::execute(const sEchoRequest &request) -> sEchoResult {
    validate(request.message);

    sEchoResult result;
    result.message = request.message;

    // One data access call per echo
    try {
        result.count = dataStore->incrementCounter("echo:" + request.message);
    } catch (eDataStoreError &e) {
        dumpExceptions(e);
        throw eDomainError(DomainErrorKind::Unavailable, "Echo history is unavailable");
    }

    return result;
}

void EchoService::validate(const std::string &message) {
    if (message.empty()) {
        throw eDomainError(DomainErrorKind::InvalidInput, "Message must not be empty");
    }

    if (message.size() > ECHO_MAX_MESSAGE_LENGTH) {
        throw eDomainError(
                DomainErrorKind::InvalidInput,
                "Message must be at most " + std::to_string(ECHO_MAX_MESSAGE_LENGTH) + " bytes"
        );
    }

    for (const auto character : message) {
        auto byte = static_cast<uint8_t>(character);
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        if (byte < 0x20 || byte == 0x7F) {
            throw eDomainError(DomainErrorKind::InvalidInput, "Message must not contain control characters");
        }
    }

    if (!isValidUtf8(message)) {
        throw eDomainError(DomainErrorKind::InvalidInput, "Message must be valid UTF-8");
    }
}
