// Copyright (C) 2019-2023 Zilliz. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance
// with the License. You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under the License.

#include "vecbridge/status.h"

namespace vecbridge {

const char*
StatusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::success:
            return "success";
        case StatusCode::unknown_error:
            return "unknown error";
        case StatusCode::internal_error:
            return "internal error";
        case StatusCode::invalid_args:
            return "invalid argument";
        case StatusCode::build_twice:
            return "index has been built, cannot build again";
        case StatusCode::index_not_empty:
            return "index is not empty";
        case StatusCode::unsupported_index:
            return "unsupported index";
        case StatusCode::unsupported_index_operation:
            return "unsupported index operation";
        case StatusCode::dimension_not_equal:
            return "dimension not equal";
        case StatusCode::index_empty:
            return "index is empty";
        case StatusCode::no_enough_memory:
            return "not enough memory";
        case StatusCode::read_error:
            return "read error";
        case StatusCode::missing_file:
            return "missing file";
        case StatusCode::invalid_binary:
            return "invalid binary";
    }
    return "unexpected status code";
}

std::string
Status::what() const {
    if (msg_.empty()) {
        return StatusCodeToString(code_);
    }
    return fmt::format("{}: {}", StatusCodeToString(code_), msg_);
}

}  // namespace vecbridge
