#include "qrdrop/server/http_pipeline.h"
#include "qrdrop/base/logger.h"
#include <chrono>

namespace qrdrop {

Handler build_pipeline(Handler handler, const std::vector<Middleware>& middleware) {
    for (auto it = middleware.rbegin(); it != middleware.rend(); ++it) {
        handler = (*it)(std::move(handler));
    }
    return handler;
}

void add_cors_headers(HttpResponse& response) {
    response.set_header("Access-Control-Allow-Origin", "*");
    response.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    response.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
    response.set_header("Access-Control-Max-Age", "86400");
}

Middleware cors_middleware() {
    return [](Handler next) -> Handler {
        return [next = std::move(next)](const HttpRequest& request) {
            HttpResponse response = next(request);
            add_cors_headers(response);
            return response;
        };
    };
}

Middleware access_log_middleware() {
    return [](Handler next) -> Handler {
        return [next = std::move(next)](const HttpRequest& request) {
            auto start = std::chrono::steady_clock::now();
            HttpResponse response = next(request);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            Logger::instance().info("{} {} - {} ({}ms)", request.method, request.path,
                                    response.status_code, elapsed);
            return response;
        };
    };
}

} // namespace qrdrop
