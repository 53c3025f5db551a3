#include "store/store.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace magenc {
namespace store {

namespace {

std::string hex_byte(uint8_t byte) {
  std::stringstream ss;
  ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  return ss.str();
}

// Holds the per-CID writer slot for the lifetime of a publish
class WriterClaim {
public:
  WriterClaim(std::mutex& mutex, std::condition_variable& cv,
              std::unordered_set<cid::Cid>& writers, const cid::Cid& cid)
    : mutex_(mutex), cv_(cv), writers_(writers), cid_(cid) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return writers_.count(cid_) == 0; });
    writers_.insert(cid_);
  }

  ~WriterClaim() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      writers_.erase(cid_);
    }
    cv_.notify_all();
  }

  WriterClaim(const WriterClaim&) = delete;
  WriterClaim& operator=(const WriterClaim&) = delete;

private:
  std::mutex& mutex_;
  std::condition_variable& cv_;
  std::unordered_set<cid::Cid>& writers_;
  const cid::Cid cid_;
};

const char* LOCK_SUFFIX = ".lock";

std::string errno_message() {
  return std::strerror(errno);
}

// Staging file written through a raw descriptor so it can be fsynced before
// it is published. Removed on destruction unless committed.
class StagingFile {
public:
  explicit StagingFile(const std::filesystem::path& path) : path_(path) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      throw StoreError("Store: Failed to create staging file " + path_.string() + ": " + errno_message());
    }
  }

  ~StagingFile() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    if (!committed_) {
      std::error_code ignored;
      std::filesystem::remove(path_, ignored);
    }
  }

  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;

  void write(const char* data, std::size_t size) {
    while (size > 0) {
      const ssize_t written = ::write(fd_, data, size);
      if (written < 0) {
        if (errno == EINTR) {
          continue;
        }
        throw StoreError("Store: Failed to write staging file " + path_.string() + ": " + errno_message());
      }
      data += written;
      size -= static_cast<std::size_t>(written);
    }
  }

  // Flushes the bytes to disk and closes the file; the caller now owns it
  void commit() {
    if (::fsync(fd_) != 0) {
      throw StoreError("Store: Failed to sync staging file " + path_.string() + ": " + errno_message());
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
      throw StoreError("Store: Failed to close staging file " + path_.string() + ": " + errno_message());
    }
    committed_ = true;
  }

private:
  std::filesystem::path path_;
  int fd_{-1};
  bool committed_{false};
};

// Takes an exclusive flock on path, creating it. Retries when a sweeping
// store unlinked the file between open and lock. Returns the held descriptor.
int lock_instance(const std::filesystem::path& path) {
  for (;;) {
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
      throw StoreError("Store: Failed to create lock " + path.string() + ": " + errno_message());
    }
    if (::flock(fd, LOCK_EX) != 0) {
      const std::string message = errno_message();
      ::close(fd);
      throw StoreError("Store: Failed to lock " + path.string() + ": " + message);
    }

    struct stat held {};
    struct stat linked {};
    if (::fstat(fd, &held) == 0 && ::stat(path.c_str(), &linked) == 0 &&
        held.st_dev == linked.st_dev && held.st_ino == linked.st_ino) {
      return fd;
    }
    ::close(fd);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Store(const std::string& root)
  : root_(root)
  , objects_dir_(root_ / "objects")
  , staging_dir_(root_ / "staging") {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with root: " << root;

  std::random_device device;
  std::stringstream token;
  token << std::hex << device() << device();
  staging_token_ = token.str();

  instance_dir_ = staging_dir_ / staging_token_;

  try {
    check_directory_exists(objects_dir_);
    check_directory_exists(staging_dir_);
    // Lock first so a concurrent sweep never sees the directory unowned
    lock_fd_ = lock_instance(lock_path(staging_token_));
    check_directory_exists(instance_dir_);
  } catch (const std::filesystem::filesystem_error& e) {
    release_instance();
    throw StoreError("Store: Cannot create store layout: " + std::string(e.what()));
  }
  clean_staging();
  BOOST_LOG_TRIVIAL(debug) << "Store: Layout verified at: " << root_.string();
}

Store::~Store() {
  release_instance();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

cid::Cid Store::put(const std::string& bytes, bool* created) {
  const cid::Cid cid = cid::Cid::compute(bytes);
  BOOST_LOG_TRIVIAL(debug) << "Store: Storing " << bytes.size() << " bytes as " << cid;

  if (created) {
    *created = false;
  }
  if (has(cid)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Object already present: " << cid;
    return cid;
  }

  const std::filesystem::path staged = make_staging_path();
  {
    StagingFile file(staged);
    file.write(bytes.data(), bytes.size());
    file.commit();
  }

  const bool fresh = publish(staged, cid);
  if (created) {
    *created = fresh;
  }
  return cid;
}

cid::Cid Store::put(std::istream& input, bool* created) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid input stream provided";
    throw StoreError("Store: Invalid input stream");
  }

  const std::filesystem::path staged = make_staging_path();
  std::size_t bytes_written = 0;
  {
    StagingFile file(staged);

    char buffer[4096];
    while (input.read(buffer, sizeof(buffer))) {
      file.write(buffer, static_cast<std::size_t>(input.gcount()));
      bytes_written += input.gcount();
    }
    // Final partial chunk
    if (input.gcount() > 0) {
      file.write(buffer, static_cast<std::size_t>(input.gcount()));
      bytes_written += input.gcount();
    }

    if (input.bad()) {
      throw StoreError("Store: Failed to stage input stream");
    }
    file.commit();
  }

  std::ifstream staged_input(staged, std::ios::binary);
  const cid::Cid cid = cid::Cid::compute(staged_input);
  staged_input.close();
  BOOST_LOG_TRIVIAL(debug) << "Store: Staged " << bytes_written << " bytes as " << cid;

  const bool fresh = publish(staged, cid);
  if (created) {
    *created = fresh;
  }
  return cid;
}

std::string Store::get(const cid::Cid& cid) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving " << cid;
  const std::filesystem::path path = object_path(cid);
  verify_object_exists(cid, path);
  return read_object(path);
}

std::string Store::get_verified(const cid::Cid& cid) const {
  std::string bytes = get(cid);
  const cid::Cid actual = cid::Cid::compute(bytes);
  if (actual != cid) {
    BOOST_LOG_TRIVIAL(error) << "Store: Stored object " << cid << " is corrupt, hashes to " << actual;
    throw IntegrityViolation(cid, actual);
  }
  return bytes;
}

void Store::remove(const cid::Cid& cid) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing " << cid;

  const std::filesystem::path path = object_path(cid);
  WriterClaim claim(writers_mutex_, writers_cv_, writers_, cid);
  std::error_code ec;
  if (!std::filesystem::remove(path, ec)) {
    if (ec) {
      throw StoreError("Store: Failed to remove " + cid.encode() + ": " + ec.message());
    }
    throw NotFound(cid);
  }

  // Clean up empty fan-out directories up to the objects directory
  auto current = path.parent_path();
  while (current != objects_dir_ && std::filesystem::is_empty(current, ec) && !ec) {
    std::filesystem::remove(current, ec);
    current = current.parent_path();
  }
}

void Store::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing store at: " << root_.string();
  {
    std::lock_guard<std::mutex> lock(writers_mutex_);
    std::filesystem::remove_all(objects_dir_);
    check_directory_exists(objects_dir_);
  }
  clean_staging();
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const cid::Cid& cid) const {
  std::error_code ec;
  const bool exists = std::filesystem::is_regular_file(object_path(cid), ec);
  BOOST_LOG_TRIVIAL(trace) << "Store: " << cid << (exists ? " exists" : " not found");
  return exists;
}

std::uintmax_t Store::size(const cid::Cid& cid) const {
  const std::filesystem::path path = object_path(cid);
  verify_object_exists(cid, path);
  return std::filesystem::file_size(path);
}

std::vector<cid::Cid> Store::list() const {
  std::vector<cid::Cid> cids;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(objects_dir_)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    try {
      const cid::Cid cid = cid::Cid::decode(name);
      if (object_path(cid) == entry.path()) {
        cids.push_back(cid);
        continue;
      }
    } catch (const cid::CidError&) {
      // Reported below
    }
    BOOST_LOG_TRIVIAL(warning) << "Store: Ignoring stray file " << entry.path().string();
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Listed " << cids.size() << " objects";
  return cids;
}

std::filesystem::path Store::object_path(const cid::Cid& cid) const {
  const auto& digest = cid.digest();
  return objects_dir_ / hex_byte(digest[0]) / hex_byte(digest[1]) / cid.encode();
}


//==============================================
// PUBLICATION SUPPORT
//==============================================

std::filesystem::path Store::make_staging_path() {
  const uint64_t sequence = staging_counter_.fetch_add(1);
  return instance_dir_ / (std::to_string(sequence) + ".tmp");
}

bool Store::publish(const std::filesystem::path& staged, const cid::Cid& cid) {
  const std::filesystem::path target = object_path(cid);
  WriterClaim claim(writers_mutex_, writers_cv_, writers_, cid);

  std::error_code ec;
  if (std::filesystem::is_regular_file(target, ec)) {
    std::filesystem::remove(staged, ec);
    BOOST_LOG_TRIVIAL(debug) << "Store: Object already present: " << cid;
    return false;
  }

  check_directory_exists(target.parent_path());
  std::filesystem::rename(staged, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(staged, ignored);
    throw StoreError("Store: Failed to publish " + cid.encode() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Stored " << cid;
  return true;
}

std::filesystem::path Store::lock_path(const std::string& token) const {
  return staging_dir_ / (token + LOCK_SUFFIX);
}

void Store::release_instance() {
  if (lock_fd_ < 0) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(instance_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Could not remove staging directory "
                               << instance_dir_.string() << ": " << ec.message();
  }
  std::filesystem::remove(lock_path(staging_token_), ec);
  ::close(lock_fd_);
  lock_fd_ = -1;
}

void Store::clean_staging() const {
  std::vector<std::filesystem::path> entries;
  for (const auto& entry : std::filesystem::directory_iterator(staging_dir_)) {
    entries.push_back(entry.path());
  }

  std::size_t removed = 0;
  const auto remove_tree = [&removed](const std::filesystem::path& path, std::error_code& ec) {
    const auto count = std::filesystem::remove_all(path, ec);
    if (!ec) {
      removed += static_cast<std::size_t>(count);
    }
  };
  for (const auto& path : entries) {
    const std::string name = path.filename().string();
    const bool is_lock = path.extension() == LOCK_SUFFIX;
    const std::string token = is_lock ? path.stem().string() : name;
    if (token == staging_token_) {
      continue;
    }

    std::error_code ec;
    if (is_lock) {
      // A live store holds its lock for its whole lifetime
      const int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
      if (fd < 0) {
        continue;
      }
      if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        ::close(fd);
        continue;
      }
      remove_tree(staging_dir_ / token, ec);
      std::filesystem::remove(path, ec);
      ::close(fd);
    } else {
      // Owners create the lock before the directory and drop it after, so a
      // directory with a lock file is judged through that lock
      if (std::filesystem::is_directory(path, ec) && std::filesystem::exists(lock_path(token), ec)) {
        continue;
      }
      remove_tree(path, ec);
    }

    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Could not remove stale staging entry "
                                 << path.string() << ": " << ec.message();
    }
  }
  if (removed > 0) {
    BOOST_LOG_TRIVIAL(info) << "Store: Removed " << removed << " stale staging entr"
                            << (removed == 1 ? "y" : "ies");
  }
}


//==============================================
// UTILITY METHODS
//==============================================

void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void Store::verify_object_exists(const cid::Cid& cid, const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Object not found: " << path.string();
    throw NotFound(cid);
  }
}

std::string Store::read_object(const std::filesystem::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open object: " + path.string());
  }

  std::string bytes;
  char buffer[4096];
  while (file.read(buffer, sizeof(buffer))) {
    bytes.append(buffer, file.gcount());
  }
  if (file.gcount() > 0) {
    bytes.append(buffer, file.gcount());
  }
  if (file.bad()) {
    throw StoreError("Store: Failed to read object: " + path.string());
  }
  return bytes;
}

} // namespace store
} // namespace magenc
