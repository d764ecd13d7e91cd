// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/disk/reassembler.hpp>
#include <splice/disk/file.hpp>
#include <splice/core/config.hpp>
#include <splice/core/log.hpp>
#include <algorithm>
#include <new>
#include <string>

namespace splicer::disk {

namespace fs = std::filesystem;

fs::path scratch_dir_for(const fs::path& destination) {
    fs::path parent = destination.parent_path();
    std::string name = "." + destination.filename().string() + ".splice";
    return parent.empty() ? fs::path(name) : parent / name;
}

fs::path sink_path(const fs::path& scratch_dir, std::uint32_t index) {
    return scratch_dir / ("segment_" + std::to_string(index));
}

std::error_code prepare_scratch_dir(const fs::path& scratch_dir) noexcept {
    std::error_code ec;
    fs::create_directories(scratch_dir, ec);
    if (ec) {
        core::log()->error("cannot create scratch directory {}: {}", scratch_dir.string(), ec.message());
        return errno_to_error_code(ec.value(), DiskErrc::directory_error);
    }
    return {};
}

std::error_code remove_scratch_dir(const fs::path& scratch_dir) noexcept {
    std::error_code ec;
    fs::remove_all(scratch_dir, ec);
    if (ec) {
        return errno_to_error_code(ec.value(), DiskErrc::directory_error);
    }
    return {};
}

std::error_code merge(std::vector<MergePart> parts, const fs::path& destination) noexcept {
    std::sort(parts.begin(), parts.end(),
              [](const MergePart& a, const MergePart& b) { return a.index < b.index; });

    auto out = File::create(destination.string());
    if (!out) {
        core::log()->error("cannot open {} for merge: {}", destination.string(), out.error().message());
        return out.error();
    }

    std::vector<std::byte> buffer;
    try {
        buffer.resize(core::MERGE_BUFFER_SIZE);
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }

    for (const auto& part : parts) {
        auto in = File::open_read(part.sink.string());
        if (!in) {
            core::log()->error("segment {} sink {} unreadable: {}", part.index, part.sink.string(),
                               in.error().message());
            return in.error();
        }

        std::uint64_t copied = 0;
        for (;;) {
            auto n = in->read(buffer.data(), core::MERGE_BUFFER_SIZE);
            if (!n) return n.error();
            if (*n == 0) break;
            if (auto ec = out->write(buffer.data(), *n)) return ec;
            copied += *n;
        }

        if (part.expected_size && copied != *part.expected_size) {
            core::log()->error("segment {} sink holds {} bytes, expected {}", part.index, copied,
                               *part.expected_size);
            return make_error_code(DiskErrc::read_error);
        }
    }

    if (auto ec = out->flush()) return ec;
    out->close();

    // Destination is complete; leftover scratch files are only a nuisance
    for (const auto& part : parts) {
        std::error_code ec;
        fs::remove(part.sink, ec);
        if (ec) {
            core::log()->warn("cannot remove {}: {}", part.sink.string(), ec.message());
        }
    }
    if (!parts.empty()) {
        if (auto ec = remove_scratch_dir(parts.front().sink.parent_path())) {
            core::log()->warn("cannot remove scratch directory: {}", ec.message());
        }
    }
    return {};
}

} // namespace splicer::disk
