#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitstack::fs {

bool exists(const std::filesystem::path &p);
void ensure_parent_dir(const std::filesystem::path &p);

std::vector<std::uint8_t> read_file(const std::filesystem::path &p);
void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data);

// Text convenience wrappers. read_text returns std::nullopt when the file is absent.
std::optional<std::string> read_text(const std::filesystem::path &p);
void write_text_atomic(const std::filesystem::path &p, std::string_view text);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

} // namespace gitstack::fs
