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

#include <string>
#include <utility>

#include "vecbridge/c_api.h"
#include "vecbridge/expected.h"

namespace vecbridge {

enum class ErrorKind {
    kConfigurationError,
    kInvalidArgument,
    kBuildError,
    kSearchError,
    kNativeFailure,
};

const char*
ErrorKindToString(ErrorKind kind);

// The binding call a native error came from. Load classifies like construction, and kQuery covers
// the read-only accessors such as Count.
enum class Operation {
    kConstruct,
    kBuild,
    kSearch,
    kDump,
    kQuery,
};

ErrorKind
ClassifyNativeError(Operation op, int native_code);

class Error {
 public:
    Error(ErrorKind kind, int native_code, std::string message)
        : kind_(kind), native_code_(native_code), message_(std::move(message)) {
    }

    // Raised by the binding itself, before any native call.
    static Error
    invalid_argument(std::string message) {
        return Error(ErrorKind::kInvalidArgument, 0, std::move(message));
    }

    // Converts a native error record. The record is not freed here.
    static Error
    FromNative(Operation op, const vecbridge_error_t& record);

    ErrorKind
    kind() const {
        return kind_;
    }

    // 0 when the error did not come from the native layer.
    int
    native_code() const {
        return native_code_;
    }

    const std::string&
    message() const {
        return message_;
    }

    std::string
    what() const;

 private:
    ErrorKind kind_;
    int native_code_;
    std::string message_;
};

template <typename T>
using Result = expected<T, Error>;

}  // namespace vecbridge
