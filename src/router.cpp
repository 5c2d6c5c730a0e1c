#include "router.hpp"
#include "errors.hpp"
#include "filesystem.hpp"
#include "path_utils.hpp"
#include "views.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace swiv {

Router::Router(const std::string& base, AuthGate auth, const MimeDetector& mime)
    : base_(fs::canonical(base).string())
    , link_base_(base_ == "/" ? "" : base_)
    , auth_(std::move(auth))
    , mime_(mime)
{
}

Response Router::route(const Request& request) const {
    try {
        return dispatch(request);
    } catch (const RespondableError& e) {
        spdlog::debug("{} {}: {}", request.method(), request.path(), e.what());
        return e.response();
    } catch (const std::exception& e) {
        spdlog::error("{} {}: {}", request.method(), request.path(), e.what());
        return Response::text(500, "Internal server error");
    }
}

Response Router::dispatch(const Request& request) const {
    auth_.authenticate(request);

    std::string pathname = resolve(request.path());
    auto entry = classify(pathname);
    if (!entry) {
        throw BadRequest();
    }

    if (auto* dir = std::get_if<Directory>(&*entry)) {
        std::string html;
        if (request.query("mode") == "viewer") {
            html = ImageView(link_base_).render(*dir);
        } else {
            html = GalleryView(link_base_).render(*dir);
        }
        return Response(200, {{"Content-Type", "text/html"}}, std::move(html));
    }

    const File& file = std::get<File>(*entry);
    std::string type = mime_.mimetype(file);
    FileStream stream = FileStream::open(file);
    spdlog::debug("Streaming {} ({} bytes, {})", file.pathname, stream.size(), type);
    return Response(200, {{"Content-Type", type}}, std::move(stream));
}

std::string Router::resolve(const std::string& request_path) const {
    if (request_path.find('\0') != std::string::npos) {
        throw BadRequest();
    }

    // Every component must exist as the OS sees it: "a.png/" or
    // "a.png/x/.." fail here instead of being normalized away
    std::error_code ec;
    fs::path candidate = fs::canonical(fs::path(join(base_, request_path)), ec);
    if (ec) {
        spdlog::debug("Cannot resolve {}: {}", request_path, ec.message());
        throw BadRequest();
    }

    std::string resolved = candidate.string();
    if (!is_within(base_, resolved)) {
        spdlog::warn("Path traversal attempt: {}", request_path);
        throw BadRequest();
    }
    return resolved;
}

} // namespace swiv
