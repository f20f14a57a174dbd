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

#if defined(__GNUC__) || defined(__clang__)
#define PROTEUS_ALWAYS_INLINE __attribute__((always_inline)) inline
#define PROTEUS_PREDICT_FALSE(x) (__builtin_expect(x, 0))
#define PROTEUS_PREDICT_TRUE(x) (__builtin_expect(!!(x), 1))
#define PROTEUS_BYTE_SWAP16 __builtin_bswap16
#define PROTEUS_BYTE_SWAP32 __builtin_bswap32
#define PROTEUS_BYTE_SWAP64 __builtin_bswap64
#elif defined(_MSC_VER)
#include <stdlib.h>
#define PROTEUS_ALWAYS_INLINE __forceinline
#define PROTEUS_PREDICT_FALSE(x) (x)
#define PROTEUS_PREDICT_TRUE(x) (x)
#define PROTEUS_BYTE_SWAP16 _byteswap_ushort
#define PROTEUS_BYTE_SWAP32 _byteswap_ulong
#define PROTEUS_BYTE_SWAP64 _byteswap_uint64
#else
#error "Unsupported compiler"
#endif

// Host byte order. Multi-byte wire values are big-endian, so little-endian
// hosts swap on every fixed-width read and write.
#if defined(_WIN32)
#define PROTEUS_LITTLE_ENDIAN 1
#elif defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
#define PROTEUS_LITTLE_ENDIAN 1
#elif defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#define PROTEUS_LITTLE_ENDIAN 0
#else
#error "Unable to detect the host byte order"
#endif
