#pragma once
#ifndef _METAD_RAFT_ERROR_H_
#define _METAD_RAFT_ERROR_H_
#include <string>
#include <system_error>

#include "error/base_error_category.h"
namespace metad {

enum class raft_error {
  CONFIG_INVALID = 1,

  // 当前节点不是 leader，调用方应转发或重试
  NOT_LEADER,

  // 提案在提交前丢失（例如 leader 下台、日志被截断），结果未知
  PROPOSAL_DROPPED,

  // 已停止的节点上调用接口
  STOPPED,

  // wait 或转发在超时内没有完成
  TIMEOUT,

  // 日志非空时再次 initialize
  ALREADY_INITIALIZED,

  // change_membership 中的新 voter 不是当前成员
  LEARNER_NOT_FOUND,

  // 上一个成员变更尚未提交
  MEMBERSHIP_CHANGE_IN_PROGRESS,

  UNKNOWN_ERROR,
};

class raft_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "raft_error"; }

  std::string message(int ev) const override {
    switch (static_cast<raft_error>(ev)) {
      case raft_error::CONFIG_INVALID:
        return "raft: invalid configuration";
      case raft_error::NOT_LEADER:
        return "raft: not leader";
      case raft_error::PROPOSAL_DROPPED:
        return "raft: proposal dropped";
      case raft_error::STOPPED:
        return "raft: stopped";
      case raft_error::TIMEOUT:
        return "raft: timeout";
      case raft_error::ALREADY_INITIALIZED:
        return "raft: already initialized";
      case raft_error::LEARNER_NOT_FOUND:
        return "raft: new voter is not a member";
      case raft_error::MEMBERSHIP_CHANGE_IN_PROGRESS:
        return "raft: membership change in progress";
      case raft_error::UNKNOWN_ERROR:
        return "raft: unknown error";
      default:
        return "Unrecognized raft error";
    }
  }
};

inline const raft_error_category& get_raft_error_category() {
  static raft_error_category instance;
  return instance;
}

inline std::error_code make_error_code(raft_error e) { return {static_cast<int>(e), get_raft_error_category()}; }

}  // namespace metad

namespace std {

template <>
struct is_error_code_enum<metad::raft_error> : true_type {};
}  // namespace std

#endif  // _METAD_RAFT_ERROR_H_
