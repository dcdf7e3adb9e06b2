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

#pragma once

#include <fmt/format.h>

#include <string>
#include <utility>

namespace vecbridge {

// Values are shared with vecbridge_error_type_t in c_api.h and must not be renumbered.
enum class StatusCode {
    success = 0,
    // [common errors]
    unknown_error = 1,
    internal_error = 2,
    invalid_args = 3,
    // [behavior errors]
    build_twice = 4,
    index_not_empty = 5,
    unsupported_index = 6,
    unsupported_index_operation = 7,
    dimension_not_equal = 8,
    index_empty = 9,
    // [runtime errors]
    no_enough_memory = 10,
    read_error = 11,
    missing_file = 12,
    invalid_binary = 13,
};

const char*
StatusCodeToString(StatusCode code);

class Status {
 public:
    Status() = default;

    Status(StatusCode code, std::string msg) : code_(code), msg_(std::move(msg)) {
    }

    static Status
    success() {
        return Status();
    }

    static Status
    invalid_args(std::string msg) {
        return Status(StatusCode::invalid_args, std::move(msg));
    }

    template <typename... Args>
    static Status
    invalid_args_in_format(fmt::format_string<Args...> format, Args&&... args) {
        return Status(StatusCode::invalid_args, fmt::format(format, std::forward<Args>(args)...));
    }

    static Status
    internal_error(std::string msg) {
        return Status(StatusCode::internal_error, std::move(msg));
    }

    static Status
    unsupported_index(std::string msg) {
        return Status(StatusCode::unsupported_index, std::move(msg));
    }

    template <typename... Args>
    static Status
    dimension_not_equal_in_format(fmt::format_string<Args...> format, Args&&... args) {
        return Status(StatusCode::dimension_not_equal, fmt::format(format, std::forward<Args>(args)...));
    }

    static Status
    index_empty(std::string msg) {
        return Status(StatusCode::index_empty, std::move(msg));
    }

    static Status
    no_enough_memory(std::string msg) {
        return Status(StatusCode::no_enough_memory, std::move(msg));
    }

    static Status
    read_error(std::string msg) {
        return Status(StatusCode::read_error, std::move(msg));
    }

    static Status
    missing_file(std::string msg) {
        return Status(StatusCode::missing_file, std::move(msg));
    }

    static Status
    invalid_binary(std::string msg) {
        return Status(StatusCode::invalid_binary, std::move(msg));
    }

    bool
    ok() const {
        return code_ == StatusCode::success;
    }

    StatusCode
    code() const {
        return code_;
    }

    const std::string&
    message() const {
        return msg_;
    }

    // "<code name>: <message>", or the code name alone when there is no message.
    std::string
    what() const;

    bool
    operator==(StatusCode code) const {
        return code_ == code;
    }

    bool
    operator!=(StatusCode code) const {
        return code_ != code;
    }

 private:
    StatusCode code_ = StatusCode::success;
    std::string msg_;
};

}  // namespace vecbridge
