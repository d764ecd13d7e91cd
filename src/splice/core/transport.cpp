// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/transport.hpp>
#include <spdlog/fmt/fmt.h>

namespace splicer::core {

std::string ByteRange::spec() const {
    return fmt::format("{}-{}", first, last);
}

std::string ByteRange::header_value() const {
    return fmt::format("bytes={}-{}", first, last);
}

} // namespace splicer::core
