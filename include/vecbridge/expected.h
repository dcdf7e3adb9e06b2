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

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "vecbridge/status.h"

namespace vecbridge {

// Holds either a value or an error. The error type defaults to the native Status; the binding layer
// instantiates it with its own Error.
template <typename T, typename E = Status>
class expected {
 public:
    template <typename... Args, typename = std::enable_if_t<std::is_constructible_v<T, Args&&...>>>
    expected(Args&&... args) : val_(std::in_place, std::forward<Args>(args)...) {
    }

    expected(const expected&) = default;
    expected(expected&&) = default;
    expected&
    operator=(const expected&) = default;
    expected&
    operator=(expected&&) = default;

    static expected
    Err(E err) {
        expected e;
        e.err_.emplace(std::move(err));
        return e;
    }

    bool
    has_value() const {
        return val_.has_value();
    }

    explicit operator bool() const {
        return has_value();
    }

    const E&
    error() const {
        if (!err_.has_value()) {
            throw std::logic_error("expected holds a value, not an error");
        }
        return err_.value();
    }

    T&
    value() & {
        return val_.value();
    }

    const T&
    value() const& {
        return val_.value();
    }

    T&&
    value() && {
        return std::move(val_).value();
    }

    T*
    operator->() {
        return &val_.value();
    }

    const T*
    operator->() const {
        return &val_.value();
    }

 private:
    expected() = default;

    std::optional<T> val_ = std::nullopt;
    std::optional<E> err_ = std::nullopt;
};

template <typename E>
class expected<void, E> {
 public:
    expected() = default;

    static expected
    Err(E err) {
        expected e;
        e.err_.emplace(std::move(err));
        return e;
    }

    bool
    has_value() const {
        return !err_.has_value();
    }

    explicit operator bool() const {
        return has_value();
    }

    const E&
    error() const {
        if (!err_.has_value()) {
            throw std::logic_error("expected holds no error");
        }
        return err_.value();
    }

 private:
    std::optional<E> err_ = std::nullopt;
};

}  // namespace vecbridge
