/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <json/json.h>

#include "DispolintException.h"
#include "JsonWrapper.h"

TEST(JsonWrapperTest, defaults) {
  JsonWrapper empty;
  EXPECT_EQ("dflt", empty.get("name", std::string("dflt")));
  EXPECT_TRUE(empty["name"].isNull());

  size_t count = 7;
  empty.get("count", size_t(3), count);
  EXPECT_EQ(3u, count);

  std::vector<std::string> names;
  empty.get("names", {"a"}, names);
  EXPECT_EQ(std::vector<std::string>{"a"}, names);
}

TEST(JsonWrapperTest, values) {
  Json::Value json(Json::objectValue);
  json["name"] = "value";
  json["count"] = 12;
  json["names"].append("x");
  json["names"].append("y");
  JsonWrapper config(json);

  EXPECT_EQ("value", config.get("name", std::string()));
  size_t count = 0;
  config.get("count", size_t(0), count);
  EXPECT_EQ(12u, count);
  std::vector<std::string> names{"stale"};
  config.get("names", {}, names);
  EXPECT_THAT(names, ::testing::ElementsAre("x", "y"));
  EXPECT_EQ("value", config["name"].asString());
}

TEST(JsonWrapperTest, notAnObject) {
  JsonWrapper config(Json::Value(5), "DisposalGuard");
  EXPECT_TRUE(config["name"].isNull());
  EXPECT_EQ("dflt", config.get("name", std::string("dflt")));
}

TEST(JsonWrapperTest, wrongTypes) {
  Json::Value json(Json::objectValue);
  json["name"] = 3;
  json["empty"] = "";
  json["count"] = -1;
  json["names"] = "x";
  json["mixed"].append("x");
  json["mixed"].append(1);
  JsonWrapper config(json);

  EXPECT_THROW(config.get("name", std::string()),
               dispolint::InvalidConfigException);
  EXPECT_THROW(config.get("empty", std::string("dflt")),
               dispolint::InvalidConfigException);
  size_t count;
  EXPECT_THROW(config.get("count", size_t(0), count),
               dispolint::InvalidConfigException);
  std::vector<std::string> names;
  EXPECT_THROW(config.get("names", {}, names),
               dispolint::InvalidConfigException);
  EXPECT_THROW(config.get("mixed", {}, names),
               dispolint::InvalidConfigException);
}

TEST(JsonWrapperTest, errorsNameTheKey) {
  Json::Value json(Json::objectValue);
  json["jobs"] = "many";
  try {
    size_t jobs;
    JsonWrapper(json).get("jobs", size_t(0), jobs);
    FAIL() << "no exception";
  } catch (const dispolint::InvalidConfigException& e) {
    EXPECT_THAT(e.what(),
                ::testing::HasSubstr("jobs must be a non-negative integer"));
  }

  try {
    JsonWrapper(json, "DisposalGuard").get("jobs", std::string());
    FAIL() << "no exception";
  } catch (const dispolint::InvalidConfigException& e) {
    EXPECT_THAT(e.what(),
                ::testing::HasSubstr("DisposalGuard.jobs must be a string"));
  }
}
