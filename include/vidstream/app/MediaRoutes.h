// vidstream/include/vidstream/app/MediaRoutes.h
#ifndef VIDSTREAM_APP_MEDIAROUTES_H
#define VIDSTREAM_APP_MEDIAROUTES_H

#include "vidstream/catalog/VideoCatalog.h"
#include "vidstream/media/ByteStreamResponder.h"
#include "vidstream/server/Router.h"

namespace Vidstream {
namespace App {

// Registers the public API:
//   GET /                      welcome message
//   GET /favicon.ico           404
//   GET /api                   {"videos": [...]}
//   GET /api/videos/:id        video/mp4, range aware
//   GET /api/thumbnails/:id    image/png, range aware
// The handlers keep references to `catalog` and `responder`, which must
// outlive the router.
void register_media_routes(Server::Router& router,
                           const Catalog::VideoCatalog& catalog,
                           const Media::ByteStreamResponder& responder);

} // namespace App
} // namespace Vidstream

#endif // VIDSTREAM_APP_MEDIAROUTES_H
