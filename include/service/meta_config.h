#pragma once
#ifndef _METAD_META_CONFIG_H_
#define _METAD_META_CONFIG_H_
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "error/leaf.h"
#include "raft/config.h"
#include "types/meta_types.h"

namespace metad::service {

struct meta_config {
  node_id id = 0;
  // RocksDB 数据目录
  std::string raft_dir;
  std::string raft_api_host = "127.0.0.1";
  std::uint16_t raft_api_port = 28004;
  std::optional<std::string> grpc_api_address;
  // 转发到 leader 的单次请求超时
  std::chrono::milliseconds forward_timeout{3000};
  // boot 等待自身成为 leader 的超时
  std::chrono::milliseconds startup_timeout{10000};
  raft::raft_config raft;

  // 其他节点访问本节点 raft 服务的地址 host:port
  std::string raft_api_advertise_host_endpoint() const;

  // 写入节点表的描述
  node get_node() const;

  leaf::result<void> validate() const;
};

struct open_options {
  // 允许打开已有数据
  bool open = true;
  // 允许创建新数据
  bool create = true;
  // 新建时以单节点集群启动
  bool initialize_cluster = false;
  // 新建且不初始化集群时，依次向这些 endpoint 发送 join
  std::vector<std::string> join_endpoints;
};

}  // namespace metad::service

#endif  // _METAD_META_CONFIG_H_
