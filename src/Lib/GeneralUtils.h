//
// Shared helpers used across the service
//

#ifndef ECHO_SERVICE_GENERALUTILS_H
#define ECHO_SERVICE_GENERALUTILS_H

#include <exception>
#include <string>

auto base64Encode(std::string input) -> std::string;
auto base64Decode(std::string input) -> std::string;

// Prints the exception and any exception stack folly's tracer has for the current thread to stderr
void dumpExceptions(std::exception& exception);

#endif //ECHO_SERVICE_GENERALUTILS_H
