// vidstream/src/server/Router.cpp
#include "vidstream/server/Router.h"
#include <iostream>
#include <stdexcept>

namespace Vidstream {
namespace Server {

void Router::add_route(Http::HttpMethod method, std::string path_template, RouteHandler handler) {
    if (path_template.empty() || path_template[0] != '/') {
        throw std::runtime_error("Invalid route path: Must start with '/'");
    }
    if (!handler) {
        throw std::runtime_error("Route " + path_template + " registered without a handler");
    }

    std::cout << "Registering " << Http::http_method_to_string(method)
              << " endpoint: " << path_template << std::endl;
    routes_.push_back(Route{method, std::move(path_template), std::move(handler)});
}

std::optional<RouteMatch> Router::find_route(Http::HttpMethod method, std::string_view path) const {
    if (path.empty() || path[0] != '/') {
        return std::nullopt;
    }

    for (const Route& route : routes_) {
        if (route.method != method) {
            continue;
        }
        std::optional<PathParams> params = PathMatcher::match(route.path_template, path);
        if (params) {
            return RouteMatch{&route.handler, std::move(*params)};
        }
    }
    return std::nullopt;
}

} // namespace Server
} // namespace Vidstream
