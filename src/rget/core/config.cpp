// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rget/core/config.hpp>
#include <rget/core/url.hpp>

namespace rget::core {

std::string TransferConfig::resolved_output_path() const {
    if (output_path && !output_path->empty()) {
        return *output_path;
    }

    auto url = Url::parse(source_url);
    if (!url) {
        return {};
    }
    return url->filename();
}

} // namespace rget::core
