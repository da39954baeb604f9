#pragma once

#include "config.hpp"

#include <cstddef>
#include <string>

namespace objdet {

// Request checks that run before any bytes reach the detection pipeline
class UploadGate {
public:
    explicit UploadGate(UploadLimits limits);

    // Throws InvalidUploadError for a missing file, non-image content type or
    // disallowed extension, PayloadTooLargeError past max_file_size.
    void check(const std::string& filename, const std::string& content_type, size_t size) const;

    bool isAllowedExtension(const std::string& filename) const;
    const UploadLimits& limits() const { return limits_; }

    // Lower-cased text after the last '.', empty if there is none
    static std::string extensionOf(const std::string& filename);

private:
    UploadLimits limits_;
};

} // namespace objdet
