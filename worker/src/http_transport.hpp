
#pragma once
#include "probe_transport.hpp"

// Probe transport backed by cpr (libcurl); handles both http and https
class HttpTransport : public ProbeTransport {
public:
    HttpTransport() = default;

    void execute(const ProbeRequest& request,
                 const ResponseHandler& on_response,
                 const ErrorHandler& on_error) override;
};
