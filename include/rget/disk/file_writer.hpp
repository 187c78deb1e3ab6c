// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rget/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace rget::disk {

enum class OpenMode : std::uint8_t {
    truncate,  // Create or truncate to zero length
    append,    // Existing file, writes go to the end
};

// Sequential writer for one output file. Owns the descriptor; closed on
// destruction.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    [[nodiscard]] std::error_code open(std::string_view path, OpenMode mode) noexcept;

    // Write the whole buffer, retrying short writes
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush to stable storage
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

private:
    int fd_{-1};
};

// Length of the regular file at path, std::nullopt if nothing exists there
[[nodiscard]] std::expected<std::optional<std::uint64_t>, std::error_code>
file_length(std::string_view path) noexcept;

// Map an errno value to a DiskErrc code
[[nodiscard]] std::error_code errno_to_error_code(int err) noexcept;

} // namespace rget::disk
