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

#include "proteus/serialization/proteus.h"

#include "proteus/serialization/deserialization_input.h"
#include "proteus/serialization/serialization_output.h"

namespace proteus {

Proteus ProteusBuilder::build() {
  serialization::ClassWhitelistPtr whitelist =
      whitelist_ != nullptr
          ? whitelist_
          : std::make_shared<serialization::EmptyWhitelist>();
  std::shared_ptr<const ClassLoader> loader =
      class_loader_ != nullptr ? class_loader_ : ClassLoader::create();
  serialization::EvolutionSerializerGetterPtr getter = evolution_getter_;
  if (getter == nullptr) {
    getter = evolution_policy_ != nullptr
                 ? std::make_shared<
                       serialization::DefaultEvolutionSerializerGetter>(
                       evolution_policy_)
                 : std::make_shared<
                       serialization::DefaultEvolutionSerializerGetter>();
  }
  serialization::FingerprinterConstructor fingerprinter =
      fingerprinter_constructor_ ? fingerprinter_constructor_
                                 : serialization::SerializerFingerprinter::create;
  return Proteus(std::make_shared<serialization::SerializerFactory>(
      config_, std::move(loader), std::move(whitelist), std::move(getter),
      std::move(fingerprinter)));
}

Result<std::vector<uint8_t>, Error> Proteus::serialize(const Value &value,
                                                       const Type &declared) const {
  serialization::SerializationOutput output(*factory_);
  return output.serialize(value, declared);
}

Result<Value, Error> Proteus::deserialize(const std::vector<uint8_t> &bytes,
                                          const Type &expected) const {
  serialization::DeserializationInput input(*factory_);
  return input.deserialize(bytes, expected);
}

} // namespace proteus
