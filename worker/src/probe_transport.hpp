
#pragma once
#include "types.hpp"
#include <chrono>
#include <functional>
#include <string>

struct ProbeRequest {
    std::string url;
    std::string method;  // upper case, as sent on the wire
    std::chrono::milliseconds timeout{0};
};

// Performs one outbound request and reports through the handlers before
// execute() returns. A well-behaved transport calls exactly one handler,
// the executor guards against transports that do not.
class ProbeTransport {
public:
    using ResponseHandler = std::function<void(int status_code)>;
    using ErrorHandler = std::function<void(const ProbeError& error)>;

    virtual ~ProbeTransport() = default;

    virtual void execute(const ProbeRequest& request,
                         const ResponseHandler& on_response,
                         const ErrorHandler& on_error) = 0;
};
