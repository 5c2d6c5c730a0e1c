#pragma once

#include "filesystem.hpp"
#include <string>
#include <utility>

namespace swiv {

// One tile per immediate child. Subdirectories show their first file (by
// pathname) as thumbnail and their recursive file count; empty ones are left
// out.
class GalleryView {
public:
    explicit GalleryView(std::string base) : base_(std::move(base)) {}

    std::string render(const Directory& dir) const;

private:
    std::string render_entry(const Entry& entry) const;
    std::string render_dir(const Directory& dir) const;
    std::string render_file(const File& file) const;

    std::string base_;
};

// Every file below the directory as a full-screen, horizontally swipeable strip
class ImageView {
public:
    explicit ImageView(std::string base) : base_(std::move(base)) {}

    std::string render(const Directory& dir) const;

private:
    std::string base_;
};

std::string html_escape(const std::string& s);

} // namespace swiv
