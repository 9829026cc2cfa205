#include "gitstack/fs.hpp"
#include "gitstack/errors.hpp"

#include <array>
#include <fstream>
#include <zlib.h>

namespace gitstack::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw StorageError("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw StorageError("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  const auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".lock";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw StorageError("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw StorageError("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw StorageError("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

std::optional<std::string> read_text(const std::filesystem::path &p) {
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  const auto bytes = read_file(p);
  return std::string(bytes.begin(), bytes.end());
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  write_file_atomic(p, std::span<const std::uint8_t>(
                           reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw StorageError("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) {
    throw StorageError("zlib inflateInit failed");
  }
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 16384> chunk{};
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw StorageError("zlib inflate failed");
    }
    out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      throw StorageError("zlib stream truncated");
    }
  }
  inflateEnd(&zs);
  return out;
}

} // namespace gitstack::fs
