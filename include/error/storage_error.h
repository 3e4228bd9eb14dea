#pragma once
#ifndef _METAD_STORAGE_ERROR_H_
#define _METAD_STORAGE_ERROR_H_
#include <string>
#include <system_error>

#include "error/base_error_category.h"

namespace metad {

enum class storage_error {
  // requested index predates the last snapshot
  COMPACTED = 1,
  // requested index is beyond the last log entry
  UNAVAILABLE,
  // no snapshot has been built yet
  SNAPSHOT_UNAVAILABLE,
  // a persisted record cannot be decoded
  CORRUPTED,
  // snapshot checksum does not match its data
  SNAPSHOT_MISMATCH,
  // raft directory is held by another process
  LOCKED,
  // raft directory does not exist and creation is not allowed
  NOT_FOUND,
  // raft directory already exists and opening is not allowed
  ALREADY_EXISTS,
  // persisted node id differs from the configured one
  ID_MISMATCH,
};

class storage_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "storage_error"; }

  std::string message(int ev) const override {
    switch (static_cast<storage_error>(ev)) {
      case storage_error::COMPACTED:
        return "requested index is unavailable due to compaction";
      case storage_error::UNAVAILABLE:
        return "requested entry at index is unavailable";
      case storage_error::SNAPSHOT_UNAVAILABLE:
        return "snapshot is unavailable";
      case storage_error::CORRUPTED:
        return "persisted record is corrupted";
      case storage_error::SNAPSHOT_MISMATCH:
        return "snapshot checksum mismatch";
      case storage_error::LOCKED:
        return "raft directory is locked by another process";
      case storage_error::NOT_FOUND:
        return "raft directory not found";
      case storage_error::ALREADY_EXISTS:
        return "raft directory already exists";
      case storage_error::ID_MISMATCH:
        return "persisted node id mismatch";
      default:
        return "Unrecognized storage error";
    }
  }
};

inline const storage_error_category& get_storage_error_category() {
  static storage_error_category instance;
  return instance;
}

inline std::error_code make_error_code(storage_error e) { return {static_cast<int>(e), get_storage_error_category()}; }

}  // namespace metad

namespace std {

template <>
struct is_error_code_enum<metad::storage_error> : true_type {};
}  // namespace std

#endif  // _METAD_STORAGE_ERROR_H_
