/* Flow-Xfer: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include <flow/log/log.hpp>
#include <flow/common.hpp>

#ifndef FLOW_OS_LINUX
#  error "Flow-Xfer relies on Linux-only system calls (copy_file_range(), splice(), sendfile()).  Build in Linux only."
#endif

namespace xfer
{

// Types.

/* Set up the `flow::log` component payload enum Log_component and its name map S_XFER_LOG_COMPONENT_NAME_MAP;
 * the members are listed in log_component_enum_declare.macros.hpp.  Same technique as Flow and Flow-IPC. */
#define FLOW_LOG_CFG_COMPONENT_ENUM_CLASS Log_component
#define FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP S_XFER_LOG_COMPONENT_NAME_MAP
#include <flow/log/macros/config_enum_start_hdr.macros.hpp>
#include "xfer/detail/macros/log_component_enum_declare.macros.hpp"
#include <flow/log/macros/config_enum_end_hdr.macros.hpp>

} // namespace xfer
