#include "monodither/io/discovery.hpp"
#include "monodither/core/utils.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace monodither::io {

const std::vector<std::string>& default_image_extensions() {
    static const std::vector<std::string> kExtensions = {
        "jpg", "jpeg", "png", "gif", "webp", "tiff", "bmp"};
    return kExtensions;
}

bool has_image_extension(const fs::path& path, const std::vector<std::string>& extensions) {
    std::string ext = path.extension().string();
    if (ext.size() < 2) {
        return false;
    }
    ext = core::to_lower(ext.substr(1));
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::vector<fs::path> discover_images(const fs::path& root,
                                      const std::vector<std::string>& extensions,
                                      const std::string& exclude_dir_name) {
    std::vector<fs::path> images;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return images;
    }

    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        const fs::path dir = std::move(pending.back());
        pending.pop_back();

        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            ec.clear();
            continue;
        }

        fs::directory_iterator end;
        for (; it != end; it.increment(ec)) {
            // a failed increment leaves the iterator at end; the remaining
            // entries of this directory cannot be listed
            if (ec) {
                break;
            }
            const fs::directory_entry& entry = *it;

            std::error_code st_ec;
            const fs::file_status st = entry.symlink_status(st_ec);
            if (st_ec) {
                continue;
            }

            if (fs::is_directory(st)) {
                if (!exclude_dir_name.empty() &&
                    entry.path().filename() == exclude_dir_name) {
                    continue;
                }
                pending.push_back(entry.path());
            } else if (fs::is_regular_file(st) &&
                       has_image_extension(entry.path(), extensions)) {
                images.push_back(entry.path());
            }
        }
        ec.clear();
    }

    std::sort(images.begin(), images.end());
    return images;
}

} // namespace monodither::io
