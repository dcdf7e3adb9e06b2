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

#include "vecbridge/error.h"

#include <fmt/format.h>

#include <cstring>

namespace vecbridge {

const char*
ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kConfigurationError:
            return "ConfigurationError";
        case ErrorKind::kInvalidArgument:
            return "InvalidArgument";
        case ErrorKind::kBuildError:
            return "BuildError";
        case ErrorKind::kSearchError:
            return "SearchError";
        case ErrorKind::kNativeFailure:
            return "NativeFailure";
    }
    return "UnknownErrorKind";
}

namespace {

// Failures of the operation itself, as opposed to bad input or I/O.
ErrorKind
OperationFailure(Operation op) {
    switch (op) {
        case Operation::kBuild:
            return ErrorKind::kBuildError;
        case Operation::kSearch:
            return ErrorKind::kSearchError;
        default:
            return ErrorKind::kNativeFailure;
    }
}

}  // namespace

ErrorKind
ClassifyNativeError(Operation op, int native_code) {
    switch (native_code) {
        case VECBRIDGE_INVALID_ARGUMENT:
            switch (op) {
                case Operation::kConstruct:
                case Operation::kSearch:
                    // The only json the caller hands over on these paths is configuration.
                    return ErrorKind::kConfigurationError;
                case Operation::kBuild:
                    return ErrorKind::kInvalidArgument;
                case Operation::kDump:
                case Operation::kQuery:
                    return ErrorKind::kNativeFailure;
            }
            return ErrorKind::kNativeFailure;
        case VECBRIDGE_UNSUPPORTED_INDEX:
            return op == Operation::kConstruct ? ErrorKind::kConfigurationError : OperationFailure(op);
        case VECBRIDGE_DIMENSION_NOT_EQUAL:
            return ErrorKind::kInvalidArgument;
        case VECBRIDGE_INTERNAL_ERROR:
        case VECBRIDGE_NO_ENOUGH_MEMORY:
        case VECBRIDGE_BUILD_TWICE:
        case VECBRIDGE_INDEX_NOT_EMPTY:
        case VECBRIDGE_UNSUPPORTED_INDEX_OPERATION:
        case VECBRIDGE_INDEX_EMPTY:
            return OperationFailure(op);
        default:
            return ErrorKind::kNativeFailure;
    }
}

Error
Error::FromNative(Operation op, const vecbridge_error_t& record) {
    auto len = strnlen(record.message, VECBRIDGE_ERROR_MESSAGE_SIZE);
    return Error(ClassifyNativeError(op, record.type), record.type, std::string(record.message, len));
}

std::string
Error::what() const {
    if (native_code_ == 0) {
        return fmt::format("{}: {}", ErrorKindToString(kind_), message_);
    }
    return fmt::format("{} (native code {}): {}", ErrorKindToString(kind_), native_code_, message_);
}

}  // namespace vecbridge
