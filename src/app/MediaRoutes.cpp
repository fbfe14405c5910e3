// vidstream/src/app/MediaRoutes.cpp
#include "vidstream/app/MediaRoutes.h"
#include <iostream>

namespace Vidstream {
namespace App {

namespace {

enum class MediaKind { VIDEO, THUMBNAIL };

void serve_media(const Http::HttpRequest& req, Http::HttpResponse& res,
                 const Catalog::VideoCatalog& catalog,
                 const Media::ByteStreamResponder& responder,
                 MediaKind kind) {
    std::optional<std::string_view> id = req.param("id");
    const Catalog::Video* video = id ? catalog.find_by_id(*id) : nullptr;
    if (!video) {
        std::cerr << "Unknown video id: " << (id ? std::string(*id) : std::string()) << std::endl;
        res.not_found();
        return;
    }

    std::string path = kind == MediaKind::VIDEO ? catalog.video_path(*video)
                                                : catalog.thumbnail_path(*video);
    if (path.empty()) {
        std::cerr << "Catalog entry " << video->id << " has no "
                  << (kind == MediaKind::VIDEO ? "videoUrl" : "thumbnailUrl") << std::endl;
        res.not_found();
        return;
    }

    responder.respond(res, req.header("range"), path,
                      kind == MediaKind::VIDEO ? "video/mp4" : "image/png");
}

} // namespace

void register_media_routes(Server::Router& router,
                           const Catalog::VideoCatalog& catalog,
                           const Media::ByteStreamResponder& responder) {
    router.get("/", [](const Http::HttpRequest& /*req*/, Http::HttpResponse& res) {
        Json::JsonValue welcome = Json::JsonValue::object();
        welcome["message"] = "Welcome to the Video Server API";
        res.status(Http::HttpStatus::OK)
           .json(welcome)
           .header("Access-Control-Allow-Origin", "*");
    });

    router.get("/favicon.ico", [](const Http::HttpRequest& /*req*/, Http::HttpResponse& res) {
        res.not_found();
    });

    router.get("/api", [&catalog](const Http::HttpRequest& /*req*/, Http::HttpResponse& res) {
        Json::JsonValue listing = Json::JsonValue::object();
        listing["videos"] = catalog.to_json();
        res.status(Http::HttpStatus::OK)
           .json(listing)
           .header("Access-Control-Allow-Origin", "*");
    });

    router.get("/api/videos/:id", [&catalog, &responder](const Http::HttpRequest& req, Http::HttpResponse& res) {
        serve_media(req, res, catalog, responder, MediaKind::VIDEO);
    });

    router.get("/api/thumbnails/:id", [&catalog, &responder](const Http::HttpRequest& req, Http::HttpResponse& res) {
        serve_media(req, res, catalog, responder, MediaKind::THUMBNAIL);
    });
}

} // namespace App
} // namespace Vidstream
