// vidstream/include/vidstream/server/Router.h
#ifndef VIDSTREAM_SERVER_ROUTER_H
#define VIDSTREAM_SERVER_ROUTER_H

#include "vidstream/http/HttpRequest.h"
#include "vidstream/http/HttpResponse.h"
#include "vidstream/http/HttpEnums.h"
#include "vidstream/server/PathMatcher.h"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Vidstream {
namespace Server {

// Type alias for route handler function
using RouteHandler = std::function<void(const Http::HttpRequest&, Http::HttpResponse&)>;

struct Route {
    Http::HttpMethod method;
    std::string path_template;
    RouteHandler handler;
};

struct RouteMatch {
    const RouteHandler* handler;
    PathParams params;
};

// Route table. Populated once at startup, then only read: the Server keeps a
// const reference and worker threads call find_route concurrently.
class Router {
public:
    Router() = default;

    // Throws std::runtime_error if the template does not start with '/'
    void add_route(Http::HttpMethod method, std::string path_template, RouteHandler handler);

    Router& get(std::string path_template, RouteHandler handler) {
        add_route(Http::HttpMethod::GET, std::move(path_template), std::move(handler));
        return *this;
    }
    Router& post(std::string path_template, RouteHandler handler) {
        add_route(Http::HttpMethod::POST, std::move(path_template), std::move(handler));
        return *this;
    }
    Router& del(std::string path_template, RouteHandler handler) {
        add_route(Http::HttpMethod::DELETE, std::move(path_template), std::move(handler));
        return *this;
    }

    // First route registered for `method` whose template matches `path`
    std::optional<RouteMatch> find_route(Http::HttpMethod method, std::string_view path) const;

    size_t size() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
};

} // namespace Server
} // namespace Vidstream

#endif // VIDSTREAM_SERVER_ROUTER_H
