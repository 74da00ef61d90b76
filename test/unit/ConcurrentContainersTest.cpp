/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ConcurrentContainers.h"

#include <atomic>
#include <gtest/gtest.h>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/thread/thread.hpp>

class ConcurrentContainersTest : public ::testing::Test {};

TEST_F(ConcurrentContainersTest, insertAndCount) {
  ConcurrentSet<std::string> set;
  EXPECT_TRUE(set.empty());
  EXPECT_TRUE(set.insert("a"));
  EXPECT_FALSE(set.insert("a"));
  EXPECT_TRUE(set.insert("b"));
  EXPECT_EQ(set.size(), 2u);
  EXPECT_EQ(set.count("a"), 1u);
  EXPECT_EQ(set.count("c"), 0u);
  set.clear();
  EXPECT_TRUE(set.empty());
}

TEST_F(ConcurrentContainersTest, concurrentInsert) {
  const size_t N_THREADS = 16;
  const size_t N = 10000;
  ConcurrentSet<uint32_t> set;
  std::atomic<size_t> fresh{0};
  std::vector<boost::thread> threads;
  for (size_t t = 0; t < N_THREADS; ++t) {
    threads.emplace_back([&]() {
      for (uint32_t i = 0; i < N; ++i) {
        if (set.insert(i)) {
          fresh++;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(fresh.load(), N);
  EXPECT_EQ(set.size(), N);
  auto elements = set.elements();
  std::unordered_set<uint32_t> unique(elements.begin(), elements.end());
  EXPECT_EQ(unique.size(), N);
}

TEST_F(ConcurrentContainersTest, iterateWhileInserting) {
  const size_t N = 10000;
  ConcurrentSet<uint32_t> set;
  for (uint32_t i = 0; i < N; ++i) {
    set.insert(i);
  }
  boost::thread writer([&]() {
    for (uint32_t i = N; i < 2 * N; ++i) {
      set.insert(i);
    }
  });
  size_t seen_old = 0;
  set.for_each([&](uint32_t key) {
    if (key < N) {
      seen_old++;
    }
  });
  writer.join();
  EXPECT_EQ(seen_old, N);
  EXPECT_EQ(set.size(), 2 * N);
}
