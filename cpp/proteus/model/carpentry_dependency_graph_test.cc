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

#include <algorithm>
#include <string>
#include <vector>

#include "proteus/model/carpentry_dependency_graph.h"
#include "gtest/gtest.h"

namespace proteus {
namespace model {

namespace {

TypeIdentifier id(const std::string &name) {
  return TypeIdentifier::parse(name).value();
}

RemoteTypeInformationPtr composable(
    const std::string &name,
    std::vector<RemotePropertyInformation> properties,
    std::vector<RemoteTypeInformationPtr> interfaces = {}) {
  return RemoteTypeInformation::composable("proteus:" + name, id(name),
                                           std::move(properties),
                                           std::move(interfaces), {});
}

RemotePropertyInformation property(const std::string &name,
                                   RemoteTypeInformationPtr type) {
  return RemotePropertyInformation{name, std::move(type), true};
}

RemoteTypeInformationPtr primitive(const std::string &name) {
  return RemoteTypeInformation::primitive(id(name));
}

std::vector<std::string> names(const std::vector<RemoteTypeInformationPtr> &types) {
  std::vector<std::string> result;
  for (const auto &type : types) {
    result.push_back(type->type_identifier().name());
  }
  return result;
}

// Records the order of carpentry and hands back wildcard types.
class RecordingCarpenter : public RemoteTypeCarpenter {
public:
  Result<Type, Error> carpent(const RemoteTypeInformation &info) override {
    carpented.push_back(info.type_identifier().name());
    return Type::wildcard();
  }

  std::vector<std::string> carpented;
};

} // namespace

TEST(CarpentryDependencyGraphTest, SingleType) {
  auto foo = composable("com.example.Foo", {property("x", primitive("int"))});
  auto ordered = CarpentryDependencyGraph::order({foo});
  ASSERT_TRUE(ordered.ok()) << ordered.error();
  EXPECT_EQ(names(*ordered), std::vector<std::string>{"com.example.Foo"});
}

TEST(CarpentryDependencyGraphTest, DependenciesPrecedeDependents) {
  auto c = composable("com.example.C", {property("x", primitive("int"))});
  auto b = composable("com.example.B", {property("c", c)});
  auto a = composable("com.example.A", {property("b", b), property("c", c)});
  auto ordered = CarpentryDependencyGraph::order({a, b, c});
  ASSERT_TRUE(ordered.ok()) << ordered.error();
  EXPECT_EQ(names(*ordered),
            (std::vector<std::string>{"com.example.C", "com.example.B",
                                      "com.example.A"}));
}

TEST(CarpentryDependencyGraphTest, IndependentTypesKeepInputOrder) {
  auto x = composable("com.example.X", {});
  auto y = composable("com.example.Y", {});
  auto z = composable("com.example.Z", {property("x", x)});
  auto ordered = CarpentryDependencyGraph::order({z, y, x});
  ASSERT_TRUE(ordered.ok());
  EXPECT_EQ(names(*ordered),
            (std::vector<std::string>{"com.example.Y", "com.example.X",
                                      "com.example.Z"}));
}

TEST(CarpentryDependencyGraphTest, InterfacesAndArraysAreDependencies) {
  auto shape = RemoteTypeInformation::an_interface(
      "proteus:shape", id("com.example.Shape"), {}, {}, {});
  auto point = composable("com.example.Point", {});
  auto points = RemoteTypeInformation::an_array(
      "proteus:points", id("com.example.Point[]"), point);
  auto circle = composable("com.example.Circle",
                           {property("outline", points)}, {shape});
  auto ordered = CarpentryDependencyGraph::order({circle, points, shape, point});
  ASSERT_TRUE(ordered.ok()) << ordered.error();
  auto order = names(*ordered);
  auto position = [&](const std::string &name) {
    return std::find(order.begin(), order.end(), name) - order.begin();
  };
  EXPECT_LT(position("com.example.Shape"), position("com.example.Circle"));
  EXPECT_LT(position("com.example.Point"), position("com.example.Point[]"));
  EXPECT_LT(position("com.example.Point[]"), position("com.example.Circle"));
}

TEST(CarpentryDependencyGraphTest, DependencyThroughTypeOutsideBatch) {
  auto foo = composable("com.example.Foo", {});
  auto list_of_foo = RemoteTypeInformation::parameterised(
      "", id("List<com.example.Foo>"), {foo});
  auto holder =
      composable("com.example.Holder", {property("foos", list_of_foo)});
  auto ordered = CarpentryDependencyGraph::order({holder, foo});
  ASSERT_TRUE(ordered.ok());
  EXPECT_EQ(names(*ordered),
            (std::vector<std::string>{"com.example.Foo",
                                      "com.example.Holder"}));
}

TEST(CarpentryDependencyGraphTest, SelfReferenceIsNotACycle) {
  auto node_ref = RemoteTypeInformation::unknown(id("com.example.Node"));
  auto node = composable("com.example.Node", {property("next", node_ref)});
  auto ordered = CarpentryDependencyGraph::order({node});
  ASSERT_TRUE(ordered.ok()) << ordered.error();
  EXPECT_EQ(ordered->size(), 1);
}

TEST(CarpentryDependencyGraphTest, CycleFailsWithoutCarpentry) {
  auto a_ref = RemoteTypeInformation::unknown(id("com.example.A"));
  auto b = composable("com.example.B", {property("a", a_ref)});
  auto a = composable("com.example.A", {property("b", b)});
  auto standalone = composable("com.example.Standalone", {});

  RecordingCarpenter carpenter;
  util::ConcurrentCache<TypeIdentifier, Type> cache;
  auto result =
      CarpentryDependencyGraph::carpent_in_order(carpenter, cache,
                                                 {standalone, a, b});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code(), ErrorCode::CarpentryError);
  EXPECT_EQ(result.error().message(),
            "Cannot build dependencies for [com.example.A, com.example.B]");
  EXPECT_TRUE(carpenter.carpented.empty());
  EXPECT_EQ(cache.size(), 0);
}

TEST(CarpentryDependencyGraphTest, CarpentInOrderUsesCache) {
  auto c = composable("com.example.C", {});
  auto b = composable("com.example.B", {property("c", c)});
  RecordingCarpenter carpenter;
  util::ConcurrentCache<TypeIdentifier, Type> cache;

  auto first = CarpentryDependencyGraph::carpent_in_order(carpenter, cache,
                                                          {b, c});
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(carpenter.carpented,
            (std::vector<std::string>{"com.example.C", "com.example.B"}));
  ASSERT_EQ(first->size(), 2);
  EXPECT_EQ(first->at(0).first, id("com.example.C"));

  auto second = CarpentryDependencyGraph::carpent_in_order(carpenter, cache,
                                                           {b, c});
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(carpenter.carpented.size(), 2);
}

} // namespace model
} // namespace proteus
