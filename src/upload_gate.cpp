#include "objdet/upload_gate.hpp"
#include "objdet/errors.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace objdet {

namespace {

std::string joinExtensions(const std::vector<std::string>& exts) {
    std::string out;
    for (const auto& ext : exts) {
        if (!out.empty()) out += ", ";
        out += ext;
    }
    return out;
}

} // namespace

UploadGate::UploadGate(UploadLimits limits) : limits_(std::move(limits)) {}

std::string UploadGate::extensionOf(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos) return {};

    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool UploadGate::isAllowedExtension(const std::string& filename) const {
    const std::string ext = extensionOf(filename);
    const auto& allowed = limits_.allowed_extensions;
    return !ext.empty() && std::find(allowed.begin(), allowed.end(), ext) != allowed.end();
}

void UploadGate::check(const std::string& filename, const std::string& content_type,
                       size_t size) const {
    if (filename.empty() || size == 0) {
        throw InvalidUploadError("No file uploaded");
    }

    if (content_type.compare(0, 6, "image/") != 0) {
        throw InvalidUploadError("File must be an image. Got: " +
                                 (content_type.empty() ? std::string("none") : content_type));
    }

    if (!isAllowedExtension(filename)) {
        throw InvalidUploadError("File type ." + extensionOf(filename) + " not allowed. Allowed: " +
                                 joinExtensions(limits_.allowed_extensions));
    }

    if (size > limits_.max_file_size) {
        std::ostringstream msg;
        msg << "File too large. Max size: " << std::setprecision(3)
            << static_cast<double>(limits_.max_file_size) / 1000000.0 << "MB";
        throw PayloadTooLargeError(msg.str());
    }
}

} // namespace objdet
