/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#pragma once

#include "proteus/model/remote_type_information.h"
#include "proteus/type/type.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace model {

/// Synthesizes a runtime type from a remote structural description.
///
/// Callers guarantee that everything `info` depends on has already been
/// carpented or is locally resolvable. Failures are reported as
/// CarpentryError.
class RemoteTypeCarpenter {
public:
  virtual ~RemoteTypeCarpenter() = default;

  virtual Result<Type, Error> carpent(const RemoteTypeInformation &info) = 0;
};

} // namespace model
} // namespace proteus
