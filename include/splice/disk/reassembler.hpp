// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/disk/error.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace splicer::disk {

// One finished segment sink to be concatenated into the destination
struct MergePart {
    std::uint32_t index{0};
    std::filesystem::path sink;
    std::optional<std::uint64_t> expected_size;
};

// Hidden per-destination scratch directory: <parent>/.<name>.splice
[[nodiscard]] std::filesystem::path scratch_dir_for(const std::filesystem::path& destination);

// <scratch>/segment_<index>
[[nodiscard]] std::filesystem::path sink_path(const std::filesystem::path& scratch_dir, std::uint32_t index);

[[nodiscard]] std::error_code prepare_scratch_dir(const std::filesystem::path& scratch_dir) noexcept;

// Remove the scratch directory and everything in it. Missing is fine.
[[nodiscard]] std::error_code remove_scratch_dir(const std::filesystem::path& scratch_dir) noexcept;

// Concatenate parts in ascending index order into destination (truncating it).
// Sinks and their scratch directory are deleted only after a successful merge;
// on failure they stay in place and the error is returned.
[[nodiscard]] std::error_code merge(std::vector<MergePart> parts,
                                    const std::filesystem::path& destination) noexcept;

} // namespace splicer::disk
