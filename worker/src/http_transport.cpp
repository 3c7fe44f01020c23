
#include "http_transport.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

void HttpTransport::execute(const ProbeRequest& request,
                            const ResponseHandler& on_response,
                            const ErrorHandler& on_error) {
    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});
    session.SetTimeout(cpr::Timeout{request.timeout});
    session.SetConnectTimeout(cpr::ConnectTimeout{request.timeout});
    session.SetRedirect(cpr::Redirect{false});

    cpr::Response response;
    if (request.method == "GET") {
        response = session.Get();
    } else if (request.method == "POST") {
        response = session.Post();
    } else if (request.method == "PUT") {
        response = session.Put();
    } else if (request.method == "DELETE") {
        response = session.Delete();
    } else {
        on_error(ProbeError::connection("unsupported method " + request.method));
        return;
    }

    if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        spdlog::debug("{} {} timed out after {} ms", request.method, request.url, request.timeout.count());
        on_error(ProbeError::timeout());
        return;
    }

    if (response.error) {
        spdlog::debug("{} {} failed: {}", request.method, request.url, response.error.message);
        on_error(ProbeError::connection(response.error.message));
        return;
    }

    on_response(static_cast<int>(response.status_code));
}
