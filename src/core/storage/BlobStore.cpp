#include "BlobStore.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "core/Errors.hpp"

namespace fs = std::filesystem;

namespace alib {

static void check_id(const std::string& id) {
  if (id.empty() || id.find_first_of("/\\") != std::string::npos || id == "." || id == "..")
    throw ValidationError("invalid blob id: " + id);
}

BlobStore::BlobStore(std::string pendingRoot, std::string confirmedRoot)
  : pendingRoot_(std::move(pendingRoot)), confirmedRoot_(std::move(confirmedRoot)) {
  fs::create_directories(pendingRoot_);
  fs::create_directories(confirmedRoot_);
}

std::string BlobStore::put(const std::string& id, std::string_view bytes) {
  check_id(id);
  fs::path file = fs::path(pendingRoot_) / id;
  fs::path tmp = file;
  tmp += ".part";
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) throw std::runtime_error("failed to write blob " + tmp.string());
  }
  fs::rename(tmp, file);
  return fs::weakly_canonical(file).string();
}

std::string BlobStore::stageFile(const std::string& id, const std::string& srcPath) {
  check_id(id);
  fs::path file = fs::path(pendingRoot_) / id;
  fs::path tmp = file;
  tmp += ".part";
  fs::copy_file(srcPath, tmp, fs::copy_options::overwrite_existing);
  fs::rename(tmp, file);
  return fs::weakly_canonical(file).string();
}

std::string BlobStore::promote(const std::string& id) {
  check_id(id);
  const fs::path dst = fs::path(confirmedRoot_) / id;
  const fs::path src = fs::path(pendingRoot_) / id;
  if (fs::exists(src)) {
    fs::rename(src, dst);
  } else if (!fs::exists(dst)) {
    throw NotFoundError("no payload for " + id);
  }
  return fs::weakly_canonical(dst).string();
}

void BlobStore::remove(const std::string& id) {
  check_id(id);
  std::error_code ec;
  fs::remove(fs::path(pendingRoot_) / id, ec);
  fs::remove(fs::path(confirmedRoot_) / id, ec);
}

bool BlobStore::exists(const std::string& id) const {
  return fs::exists(fs::path(pendingRoot_) / id) || fs::exists(fs::path(confirmedRoot_) / id);
}

bool BlobStore::isConfirmed(const std::string& id) const {
  return fs::exists(fs::path(confirmedRoot_) / id);
}

std::string BlobStore::path(const std::string& id) const {
  check_id(id);
  for (const auto* root : {&pendingRoot_, &confirmedRoot_}) {
    fs::path p = fs::path(*root) / id;
    if (fs::exists(p)) return p.string();
  }
  throw NotFoundError("no payload for " + id);
}

uint64_t BlobStore::size(const std::string& id) const {
  return static_cast<uint64_t>(fs::file_size(path(id)));
}

std::string BlobStore::read(const std::string& id, uint64_t offset, uint64_t length) const {
  const std::string p = path(id);
  std::ifstream in(p, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open blob " + p);
  in.seekg(static_cast<std::streamoff>(offset));
  std::string out(static_cast<size_t>(length), '\0');
  in.read(out.data(), static_cast<std::streamsize>(length));
  if (static_cast<uint64_t>(in.gcount()) != length)
    throw std::runtime_error("short read on blob " + p + " at offset " + std::to_string(offset));
  return out;
}

} // namespace alib
