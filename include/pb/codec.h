#pragma once
#ifndef _METAD_PB_CODEC_H_
#define _METAD_PB_CODEC_H_
#include <metad.pb.h>

#include <system_error>

#include "error/leaf.h"
#include "raft/types.h"
#include "types/meta_types.h"

// 领域类型与 protobuf 消息之间的转换。from_pb 遇到未设置的 oneof 返回 logic_error::MALFORMED_MESSAGE
namespace metad::pb {

metadpb::node to_pb(const node& n);
node from_pb(const metadpb::node& n);

metadpb::seq_v to_pb(const seqv& v);
seqv from_pb(const metadpb::seq_v& v);

metadpb::match_seq to_pb(const match_seq& m);
leaf::result<match_seq> from_pb(const metadpb::match_seq& m);

metadpb::log_entry to_pb(const log_entry& e);
leaf::result<log_entry> from_pb(const metadpb::log_entry& e);

metadpb::applied_state to_pb(const applied_state& s);
leaf::result<applied_state> from_pb(const metadpb::applied_state& s);

metadpb::log_id to_pb(const raft::log_id& id);
raft::log_id from_pb(const metadpb::log_id& id);

metadpb::membership to_pb(const raft::membership& m);
raft::membership from_pb(const metadpb::membership& m);

// forward_error 只在进程内路由中传递，按 category 名称还原错误码
metadpb::forward_error to_pb(const std::error_code& ec);
std::error_code from_pb(const metadpb::forward_error& err);

inline raft::log_id entry_log_id(const metadpb::entry& ent) { return raft::log_id{ent.term(), ent.index()}; }

}  // namespace metad::pb

#endif  // _METAD_PB_CODEC_H_
