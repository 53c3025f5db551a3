#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>
#include "cid/cid.hpp"

namespace magenc {
namespace store {

// Content-addressed object store. Objects live at
//   {root}/objects/{hex digest[0]}/{hex digest[1]}/{cid text}
// and are published by renaming a finished file out of the store's own
// {root}/staging/{token} directory, which {root}/staging/{token}.lock keeps
// alive while the store is open.
class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the layout if needed and removes staging files left by stores
  // that are no longer running
  explicit Store(const std::string& root);
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Stores bytes under their CID. created is set to false when the object
  // was already present.
  cid::Cid put(const std::string& bytes, bool* created = nullptr);
  // Streams input into staging, hashes the staged file, then publishes it
  cid::Cid put(std::istream& input, bool* created = nullptr);
  // Throws NotFound
  std::string get(const cid::Cid& cid) const;
  // Like get but re-hashes the bytes, throws IntegrityViolation on mismatch
  std::string get_verified(const cid::Cid& cid) const;
  // Throws NotFound
  void remove(const cid::Cid& cid);
  // Removes every object and stale staging files
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has(const cid::Cid& cid) const;
  // Size of the stored object in bytes, throws NotFound
  std::uintmax_t size(const cid::Cid& cid) const;
  // Every stored CID, in no particular order
  std::vector<cid::Cid> list() const;

  const std::filesystem::path& root() const { return root_; }
  const std::filesystem::path& staging_directory() const { return instance_dir_; }
  std::filesystem::path object_path(const cid::Cid& cid) const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;
  std::filesystem::path objects_dir_;
  std::filesystem::path staging_dir_;

  // Staging names: "{token}/{counter}.tmp"
  std::string staging_token_;
  std::filesystem::path instance_dir_;
  int lock_fd_{-1};
  std::atomic<uint64_t> staging_counter_{0};

  // CIDs currently being published
  mutable std::mutex writers_mutex_;
  std::condition_variable writers_cv_;
  std::unordered_set<cid::Cid> writers_;


  // ---- PUBLICATION SUPPORT ----
  std::filesystem::path make_staging_path();
  // Moves a finished staging file to its final path unless the object
  // already exists. Returns true when this call created the object.
  bool publish(const std::filesystem::path& staged, const cid::Cid& cid);
  std::filesystem::path lock_path(const std::string& token) const;
  // Unlocks and removes this store's staging directory
  void release_instance();
  // Removes staging entries whose owning store has exited
  void clean_staging() const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  void verify_object_exists(const cid::Cid& cid, const std::filesystem::path& path) const;
  std::string read_object(const std::filesystem::path& path) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

class NotFound : public StoreError {
public:
  explicit NotFound(const cid::Cid& cid)
    : StoreError("Store: Object not found: " + cid.encode()), cid_(cid) {}

  const cid::Cid& cid() const { return cid_; }

private:
  cid::Cid cid_;
};

// Stored or received bytes do not hash to the CID they were filed under
class IntegrityViolation : public StoreError {
public:
  IntegrityViolation(const cid::Cid& expected, const cid::Cid& actual)
    : StoreError("Store: Integrity violation: expected " + expected.encode()
                 + ", content hashes to " + actual.encode())
    , expected_(expected)
    , actual_(actual) {}

  const cid::Cid& expected() const { return expected_; }
  const cid::Cid& actual() const { return actual_; }

private:
  cid::Cid expected_;
  cid::Cid actual_;
};

} // namespace store
} // namespace magenc
