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

#include <glog/logging.h>

#define VECBRIDGE_MODULE_NAME "VECBRIDGE"
#define VECBRIDGE_MODULE_FUNCTION "[" VECBRIDGE_MODULE_NAME "][" << __FUNCTION__ << "] "

// TRACE and DEBUG are compiled out of release builds.
#define LOG_VECBRIDGE_TRACE_ DVLOG(2) << VECBRIDGE_MODULE_FUNCTION
#define LOG_VECBRIDGE_DEBUG_ DVLOG(1) << VECBRIDGE_MODULE_FUNCTION
#define LOG_VECBRIDGE_INFO_ LOG(INFO) << VECBRIDGE_MODULE_FUNCTION
#define LOG_VECBRIDGE_WARNING_ LOG(WARNING) << VECBRIDGE_MODULE_FUNCTION
#define LOG_VECBRIDGE_ERROR_ LOG(ERROR) << VECBRIDGE_MODULE_FUNCTION
#define LOG_VECBRIDGE_FATAL_ LOG(FATAL) << VECBRIDGE_MODULE_FUNCTION
