#include "helios/state_store.hpp"

// EXTENSION_POINT: append_only_journal
//   FileStateStore writes one file per key. A crash between the tmp write and
//   rename leaves only an orphaned ".tmp_*" file, which purge_expired() sweeps.

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#if defined(HELIOS_WITH_ZSTD)
#include <zstd.h>
#endif

#include "helios/hash.hpp"
#include "helios/jsonlite.hpp"
#include "helios/observability.hpp"
#include "helios/version.hpp"

namespace fs = std::filesystem;

namespace helios {

namespace {

#if defined(HELIOS_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

bool decompress_zstd(const std::string& data, std::size_t original_size, std::string& out) {
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return false;
  return true;
}
#endif

// Unique temporary filename so concurrent writers never share a tmp file.
std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file, then rename into place (atomic on POSIX within one
// filesystem).
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

// Exclusive advisory lock on a file for the lifetime of the object.
class FileLock {
 public:
  explicit FileLock(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT, 0644);
    if (fd_ >= 0 && ::flock(fd_, LOCK_EX) != 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }
  ~FileLock() {
    if (fd_ >= 0) {
      ::flock(fd_, LOCK_UN);
      ::close(fd_);
    }
  }
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  bool held() const { return fd_ >= 0; }

 private:
  int fd_{-1};
};

}  // namespace

std::string to_string(StoreStatus status) {
  switch (status) {
    case StoreStatus::ok: return "ok";
    case StoreStatus::not_found: return "not_found";
    case StoreStatus::conflict: return "conflict";
    case StoreStatus::unavailable: return "unavailable";
  }
  return "unavailable";
}

// ---------------------------------------------------------------------------
// MemoryStateStore
// ---------------------------------------------------------------------------

MemoryStateStore::MemoryStateStore(std::shared_ptr<const Clock> clock)
    : clock_(std::move(clock)) {}

uint64_t MemoryStateStore::expiry_for(uint64_t ttl_ms) const {
  return ttl_ms == 0 ? 0 : clock_->now_unix_ms() + ttl_ms;
}

StoreStatus MemoryStateStore::get(const std::string& key, std::string& out,
                                  uint64_t* expires_at) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return StoreStatus::not_found;
  if (!live(it->second, clock_->now_unix_ms())) {
    entries_.erase(it);
    return StoreStatus::not_found;
  }
  out = it->second.value;
  if (expires_at) *expires_at = it->second.expires_at;
  return StoreStatus::ok;
}

StoreStatus MemoryStateStore::set(const std::string& key, const std::string& value,
                                  uint64_t ttl_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_[key] = Entry{value, expiry_for(ttl_ms)};
  return StoreStatus::ok;
}

StoreStatus MemoryStateStore::compare_and_swap(const std::string& key,
                                               const std::optional<std::string>& expected,
                                               const std::string& desired, uint64_t ttl_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key);
  const bool present = it != entries_.end() && live(it->second, clock_->now_unix_ms());
  if (!expected) {
    if (present) return StoreStatus::conflict;
  } else if (!present || it->second.value != *expected) {
    return StoreStatus::conflict;
  }
  entries_[key] = Entry{desired, expiry_for(ttl_ms)};
  return StoreStatus::ok;
}

StoreStatus MemoryStateStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return StoreStatus::not_found;
  const bool was_live = live(it->second, clock_->now_unix_ms());
  entries_.erase(it);
  return was_live ? StoreStatus::ok : StoreStatus::not_found;
}

std::vector<std::string> MemoryStateStore::scan_keys(const std::string& prefix) const {
  std::lock_guard<std::mutex> lk(mu_);
  const uint64_t now = clock_->now_unix_ms();
  std::vector<std::string> out;
  for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    if (live(it->second, now)) out.push_back(it->first);
  }
  return out;
}

size_t MemoryStateStore::purge_expired() {
  std::lock_guard<std::mutex> lk(mu_);
  const uint64_t now = clock_->now_unix_ms();
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (!live(it->second, now)) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t MemoryStateStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  const uint64_t now = clock_->now_unix_ms();
  return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                           [&](const auto& kv) { return live(kv.second, now); }));
}

// ---------------------------------------------------------------------------
// FileStateStore
// ---------------------------------------------------------------------------

FileStateStore::FileStateStore(std::string root, std::shared_ptr<const Clock> clock,
                               size_t compress_threshold_bytes)
    : root_(std::move(root)),
      clock_(std::move(clock)),
      compress_threshold_bytes_(compress_threshold_bytes) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
  if (ec) log_error("store", "cannot create " + root_ + ": " + ec.message());
}

std::string FileStateStore::object_path(const std::string& key) const {
  const std::string digest = store_object_digest(key);
  return (fs::path(root_) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string FileStateStore::lock_path() const {
  return (fs::path(root_) / "store.lock").string();
}

StoreStatus FileStateStore::read_object(const std::string& path, Header& header,
                                        std::string* payload) const {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return StoreStatus::not_found;
  std::string line;
  if (!std::getline(ifs, line)) return StoreStatus::not_found;

  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object h = jsonlite::parse(line, &err);
  if (err) {
    log_warn("store", "corrupt object header in " + path + ": " + err->message);
    return StoreStatus::not_found;
  }
  if (jsonlite::get_u64(h, "format", 0) != version::FILE_STORE_FORMAT_VERSION) {
    log_warn("store", "unsupported object format in " + path);
    return StoreStatus::not_found;
  }
  header.key = jsonlite::get_string(h, "key");
  header.expires_at = jsonlite::get_u64(h, "expires_at");
  header.encoding = jsonlite::get_string(h, "encoding", "identity");
  header.original_size = static_cast<size_t>(jsonlite::get_u64(h, "original_size"));
  header.stored_size = static_cast<size_t>(jsonlite::get_u64(h, "stored_size"));
  header.blob_hash = jsonlite::get_string(h, "blob_hash");

  if (header.expires_at != 0 && clock_->now_unix_ms() >= header.expires_at) {
    return StoreStatus::not_found;
  }
  if (!payload) return StoreStatus::ok;

  std::string stored((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (stored.size() != header.stored_size || store_blob_hash(stored) != header.blob_hash) {
    log_error("store", "integrity check failed for key " + header.key);
    return StoreStatus::not_found;
  }
  if (header.encoding == "identity") {
    *payload = std::move(stored);
    return StoreStatus::ok;
  }
#if defined(HELIOS_WITH_ZSTD)
  if (header.encoding == "zstd") {
    if (!decompress_zstd(stored, header.original_size, *payload)) {
      log_error("store", "zstd decode failed for key " + header.key);
      return StoreStatus::not_found;
    }
    return StoreStatus::ok;
  }
#endif
  log_error("store", "unsupported encoding '" + header.encoding + "' for key " + header.key);
  return StoreStatus::unavailable;
}

StoreStatus FileStateStore::read_live_locked(const std::string& key, std::string& out) const {
  Header header;
  const StoreStatus st = read_object(object_path(key), header, &out);
  if (st != StoreStatus::ok) return st;
  return header.key == key ? StoreStatus::ok : StoreStatus::not_found;
}

StoreStatus FileStateStore::write_object(const std::string& key, const std::string& value,
                                         uint64_t ttl_ms) {
  std::string stored = value;
  std::string encoding = "identity";
#if defined(HELIOS_WITH_ZSTD)
  if (value.size() >= compress_threshold_bytes_) {
    std::string compressed = compress_zstd(value);
    if (!compressed.empty() && compressed.size() < value.size()) {
      stored = std::move(compressed);
      encoding = "zstd";
    }
  }
#endif
  jsonlite::Object h;
  h["format"] = jsonlite::Value{static_cast<std::uint64_t>(version::FILE_STORE_FORMAT_VERSION)};
  h["key"] = jsonlite::Value{key};
  h["expires_at"] = jsonlite::Value{static_cast<std::uint64_t>(ttl_ms == 0 ? 0 : clock_->now_unix_ms() + ttl_ms)};
  h["encoding"] = jsonlite::Value{encoding};
  h["original_size"] = jsonlite::Value{static_cast<std::uint64_t>(value.size())};
  h["stored_size"] = jsonlite::Value{static_cast<std::uint64_t>(stored.size())};
  h["blob_hash"] = jsonlite::Value{store_blob_hash(stored)};

  std::string data = jsonlite::to_json(h);
  data += '\n';
  data += stored;
  if (!atomic_write(object_path(key), data)) {
    log_error("store", "atomic write failed for key " + key);
    return StoreStatus::unavailable;
  }
  return StoreStatus::ok;
}

StoreStatus FileStateStore::get(const std::string& key, std::string& out,
                                uint64_t* expires_at) const {
  Header header;
  std::string payload;
  const StoreStatus st = read_object(object_path(key), header, &payload);
  if (st == StoreStatus::not_found && header.key == key && header.expires_at != 0 &&
      clock_->now_unix_ms() >= header.expires_at) {
    drop_if_expired(key);
  }
  if (st != StoreStatus::ok) return st;
  if (header.key != key) return StoreStatus::not_found;
  out = std::move(payload);
  if (expires_at) *expires_at = header.expires_at;
  return StoreStatus::ok;
}

// Re-checks under both locks so a concurrent rewrite of the key survives.
void FileStateStore::drop_if_expired(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  FileLock lock(lock_path());
  if (!lock.held()) return;
  const std::string path = object_path(key);
  Header header;
  if (read_object(path, header, nullptr) != StoreStatus::not_found || header.key != key ||
      header.expires_at == 0 || clock_->now_unix_ms() < header.expires_at) {
    return;
  }
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) log_warn("store", "cannot remove expired object for key " + key + ": " + ec.message());
}

StoreStatus FileStateStore::set(const std::string& key, const std::string& value,
                                uint64_t ttl_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  FileLock lock(lock_path());
  if (!lock.held()) return StoreStatus::unavailable;
  return write_object(key, value, ttl_ms);
}

StoreStatus FileStateStore::compare_and_swap(const std::string& key,
                                             const std::optional<std::string>& expected,
                                             const std::string& desired, uint64_t ttl_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  FileLock lock(lock_path());
  if (!lock.held()) return StoreStatus::unavailable;

  std::string current;
  const StoreStatus st = read_live_locked(key, current);
  if (st == StoreStatus::unavailable) return st;
  const bool present = st == StoreStatus::ok;
  if (!expected) {
    if (present) return StoreStatus::conflict;
  } else if (!present || current != *expected) {
    return StoreStatus::conflict;
  }
  return write_object(key, desired, ttl_ms);
}

StoreStatus FileStateStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  FileLock lock(lock_path());
  if (!lock.held()) return StoreStatus::unavailable;

  const std::string path = object_path(key);
  Header header;
  const StoreStatus st = read_object(path, header, nullptr);
  std::error_code ec;
  if (!fs::exists(path, ec)) return StoreStatus::not_found;
  if (st == StoreStatus::ok && header.key != key) return StoreStatus::not_found;
  fs::remove(path, ec);
  if (ec) return StoreStatus::unavailable;
  return st == StoreStatus::ok ? StoreStatus::ok : StoreStatus::not_found;
}

std::vector<std::string> FileStateStore::object_files() const {
  std::vector<std::string> out;
  std::error_code ec;
  const fs::path objects = fs::path(root_) / "objects";
  if (!fs::exists(objects, ec)) return out;
  for (auto it = fs::recursive_directory_iterator(objects, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    out.push_back(it->path().string());
  }
  return out;
}

std::vector<std::string> FileStateStore::scan_keys(const std::string& prefix) const {
  std::vector<std::string> out;
  for (const auto& path : object_files()) {
    if (fs::path(path).filename().string().rfind(".tmp_", 0) == 0) continue;
    Header header;
    if (read_object(path, header, nullptr) != StoreStatus::ok) continue;
    if (header.key.compare(0, prefix.size(), prefix) == 0) out.push_back(header.key);
  }
  std::sort(out.begin(), out.end());
  return out;
}

size_t FileStateStore::purge_expired() {
  std::lock_guard<std::mutex> lk(mu_);
  FileLock lock(lock_path());
  if (!lock.held()) return 0;
  size_t removed = 0;
  std::error_code ec;
  for (const auto& path : object_files()) {
    const bool orphan_tmp = fs::path(path).filename().string().rfind(".tmp_", 0) == 0;
    Header header;
    if (orphan_tmp || read_object(path, header, nullptr) == StoreStatus::not_found) {
      if (fs::remove(path, ec)) ++removed;
    }
  }
  return removed;
}

size_t FileStateStore::size() const {
  return scan_keys("").size();
}

std::shared_ptr<IStateStore> make_state_store(const std::string& backend, const std::string& root,
                                              std::shared_ptr<const Clock> clock,
                                              size_t compress_threshold_bytes) {
  if (backend == "file") {
    return std::make_shared<FileStateStore>(root, std::move(clock), compress_threshold_bytes);
  }
  return std::make_shared<MemoryStateStore>(std::move(clock));
}

}  // namespace helios
