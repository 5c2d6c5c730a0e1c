#include "views.hpp"
#include "path_utils.hpp"
#include "walker.hpp"
#include <sstream>

namespace swiv {

namespace {

const char* const gallery_css = R"(
html {
    background: black;
    color: white;
    overflow: hidden;
    font-family: sans;
}
body {
    margin: 0;
    display: flex;
    flex-direction: column;
    flex-wrap: wrap;
    height: 100vh;
    overflow-x: scroll;
    scrollbar-width: none;
}
article {
    overflow-wrap: anywhere;
    height: 25vh;
    width: 25vh;
    position: relative;
    overflow: hidden;
}
a {
    color: inherit;
    text-decoration: inherit;
    cursor: pointer;
}
article img {
    width: 100%;
    height: 100%;
    object-fit: cover;
}
article label {
    position: absolute;
    left: 0;
    right: 0;
    bottom: 0;
    padding: 0.5em;
    background: #0008;
}
nav {
    position: absolute;
    bottom: 1em;
    right: 1em;
    background: orange;
    z-index: 1000;
    border-radius: 0.5em;
}
nav a {
    display: block;
    padding: 1em;
}
)";

const char* const viewer_css = R"(
html {
    background: black;
    color: white;
    overflow: hidden;
}
body {
    margin: 0;
    display: flex;
    height: 100vh;
    overflow-x: scroll;
    scrollbar-width: none;
    scroll-snap-type: x proximity;
    max-width: fit-content;
}
img {
    height: 100vh;
    width: 100vw;
    object-fit: contain;
    scroll-snap-align: center;
}
)";

std::string layout(const char* css, const std::string& body) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html>\n"
        << "<html>\n"
        << "<head>\n"
        << "<meta charset='utf-8'>\n"
        << "<meta name='viewport' content='width=device-width, initial-scale=1' />\n"
        << "<title>swiv</title>\n"
        << "<style>" << css << "</style>\n"
        << "</head>\n"
        << "<body>" << body << "</body>\n"
        << "</html>\n";
    return oss.str();
}

// Attribute value for a link back into the gallery
std::string asset_link(const std::string& base, const std::string& pathname) {
    return html_escape(url_encode_path(relative_to(base, pathname)));
}

} // namespace

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

// ─── Gallery ─────────────────────────────────────────────────────────────────

std::string GalleryView::render(const Directory& dir) const {
    std::string body = "\n<nav><a href=\"?mode=viewer\">&#128065;</a></nav>\n";
    for (const auto& entry : list_children(dir.pathname)) {
        body += render_entry(entry);
    }
    return layout(gallery_css, body);
}

std::string GalleryView::render_entry(const Entry& entry) const {
    if (auto* dir = std::get_if<Directory>(&entry)) {
        return render_dir(*dir);
    }
    return render_file(std::get<File>(entry));
}

std::string GalleryView::render_dir(const Directory& dir) const {
    auto files = collect_files(dir);
    if (files.empty()) return "";

    std::ostringstream oss;
    oss << "<article>"
        << "<a href=\"" << asset_link(base_, dir.pathname) << "\">"
        << "<img src=\"" << asset_link(base_, files.front().pathname) << "\" loading='lazy'>"
        << "<label>" << html_escape(dir.basename()) << " (" << files.size() << ")</label>"
        << "</a>"
        << "</article>\n";
    return oss.str();
}

std::string GalleryView::render_file(const File& file) const {
    std::ostringstream oss;
    oss << "<article>"
        << "<img src=\"" << asset_link(base_, file.pathname) << "\" loading='lazy'>"
        << "</article>\n";
    return oss.str();
}

// ─── Viewer ──────────────────────────────────────────────────────────────────

std::string ImageView::render(const Directory& dir) const {
    std::string body = "\n";
    for (const auto& file : collect_files(dir)) {
        body += "<img src=\"" + asset_link(base_, file.pathname) + "\" loading='lazy'>\n";
    }
    return layout(viewer_css, body);
}

} // namespace swiv
