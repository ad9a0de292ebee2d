#pragma once

#include "monodither/core/types.hpp"

#include <string>
#include <vector>

namespace monodither::io {

// jpg, jpeg, png, gif, webp, tiff, bmp
const std::vector<std::string>& default_image_extensions();

// Case-insensitive match of the path's extension (without the dot)
// against a list of lower-case extensions.
bool has_image_extension(const fs::path& path, const std::vector<std::string>& extensions);

/**
 * Recursively collect regular files under root whose extension is in
 * extensions. Symlinks are neither followed nor returned. Entries and
 * directories that cannot be read are skipped; if reading a directory fails
 * part way, the entries not yet listed are lost. Directories named
 * exclude_dir_name (if not empty) are not descended into. Result is sorted.
 */
std::vector<fs::path> discover_images(const fs::path& root,
                                      const std::vector<std::string>& extensions =
                                          default_image_extensions(),
                                      const std::string& exclude_dir_name = "");

} // namespace monodither::io
