#pragma once
#ifndef _METAD_PB_TYPES_H_
#define _METAD_PB_TYPES_H_
#include <metad.pb.h>

#include <cstdint>
#include <vector>

namespace metad::pb {

using repeated_entry = google::protobuf::RepeatedPtrField<metadpb::entry>;
using entry_list = std::vector<metadpb::entry>;

}  // namespace metad::pb

#endif  // _METAD_PB_TYPES_H_
