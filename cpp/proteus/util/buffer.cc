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

#include "proteus/util/buffer.h"

#include <cstdlib>
#include <limits>

namespace proteus {

void Buffer::grow(uint32_t min_capacity) {
  PROTEUS_CHECK(!read_only_) << "Cannot write to a read-only buffer view";
  uint64_t needed = static_cast<uint64_t>(writer_index_) + min_capacity;
  PROTEUS_CHECK(needed < std::numeric_limits<uint32_t>::max())
      << "Buffer overflow writer_index " << writer_index_ << " diff "
      << min_capacity;
  if (needed <= size_) {
    return;
  }
  // Round up to the next word after doubling.
  uint64_t new_size = ((needed * 2) + 63) & ~static_cast<uint64_t>(63);
  if (new_size >= std::numeric_limits<uint32_t>::max()) {
    new_size = std::numeric_limits<uint32_t>::max() - 1;
  }
  auto *new_ptr =
      static_cast<uint8_t *>(std::realloc(data_, static_cast<size_t>(new_size)));
  PROTEUS_CHECK(new_ptr != nullptr) << "Out of memory when growing buffer to "
                                    << new_size << " bytes";
  data_ = new_ptr;
  size_ = static_cast<uint32_t>(new_size);
}

std::string Buffer::hex() const {
  static const char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<size_t>(writer_index_) * 2);
  for (uint32_t i = 0; i < writer_index_; ++i) {
    out.push_back(kDigits[data_[i] >> 4]);
    out.push_back(kDigits[data_[i] & 0x0f]);
  }
  return out;
}

} // namespace proteus
