// vidstream/include/vidstream/Vidstream.h
#ifndef VIDSTREAM_VIDSTREAM_H
#define VIDSTREAM_VIDSTREAM_H

// Core components
#include "vidstream/http/HttpEnums.h"
#include "vidstream/http/HttpRequest.h"
#include "vidstream/http/HttpResponse.h"
#include "vidstream/http/HttpParser.h"

#include "vidstream/net/Connection.h"

#include "vidstream/server/PathMatcher.h"
#include "vidstream/server/Router.h"
#include "vidstream/server/Server.h"
#include "vidstream/server/ThreadPool.h"

// Media streaming
#include "vidstream/media/FileHandle.h"
#include "vidstream/media/FileMetadata.h"
#include "vidstream/media/RangeParser.h"
#include "vidstream/media/RangeResolver.h"
#include "vidstream/media/RangeStream.h"
#include "vidstream/media/ByteStreamResponder.h"

#include "vidstream/catalog/VideoCatalog.h"
#include "vidstream/platform/ServerConfig.h"
#include "vidstream/app/MediaRoutes.h"

#endif // VIDSTREAM_VIDSTREAM_H
