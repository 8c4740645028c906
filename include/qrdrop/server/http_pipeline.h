#ifndef QRDROP_SERVER_HTTP_PIPELINE_H
#define QRDROP_SERVER_HTTP_PIPELINE_H

#include "qrdrop/net/http_message.h"
#include <functional>
#include <vector>

namespace qrdrop {

using Handler = std::function<HttpResponse(const HttpRequest&)>;
using Middleware = std::function<Handler(Handler)>;

// The first middleware in the list is the outermost wrapper
Handler build_pipeline(Handler handler, const std::vector<Middleware>& middleware);

void add_cors_headers(HttpResponse& response);

// Adds the CORS headers to every response
Middleware cors_middleware();

// Logs "METHOD path - status (Nms)" for every request
Middleware access_log_middleware();

} // namespace qrdrop

#endif // QRDROP_SERVER_HTTP_PIPELINE_H
