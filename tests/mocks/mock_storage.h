#pragma once
#ifndef TESTS_MOCKS_MOCK_STORAGE_H
#define TESTS_MOCKS_MOCK_STORAGE_H

#include "evichain/storage.hpp"

#include <gmock/gmock.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Storage kept entirely in memory. Keys map to contents; list() reports the
// next path component below the prefix.
class InMemoryStorage : public evichain::Storage {
public:
  std::optional<std::string> read(const std::string &key) override {
    auto it = files_.find(key);
    if (it == files_.end())
      return std::nullopt;
    return it->second;
  }

  void write(const std::string &key, const std::string &bytes) override {
    files_[key] = bytes;
    ++writes_;
  }

  bool create(const std::string &key, const std::string &bytes) override {
    if (files_.count(key) > 0)
      return false;
    write(key, bytes);
    return true;
  }

  bool exists(const std::string &key) override {
    return files_.count(key) > 0;
  }

  std::vector<std::string> list(const std::string &prefix) override {
    std::vector<std::string> names;
    const std::string base = prefix.empty() ? "" : prefix + "/";
    for (const auto &kv : files_) {
      if (kv.first.compare(0, base.size(), base) != 0)
        continue;
      std::string rest = kv.first.substr(base.size());
      std::string name = rest.substr(0, rest.find('/'));
      if (names.empty() || names.back() != name)
        names.push_back(name);
    }
    return names;
  }

  std::string resolve(const std::string &key) const override {
    return "mem://" + key;
  }

  std::map<std::string, std::string> &files() { return files_; }
  int writes() const { return writes_; }

private:
  std::map<std::string, std::string> files_;
  int writes_ = 0;
};

// Failure injection. Delegate to an InMemoryStorage by default and override
// individual calls with EXPECT_CALL/ON_CALL.
class MockStorage : public evichain::Storage {
public:
  MockStorage() {
    using ::testing::_;
    ON_CALL(*this, read(_)).WillByDefault([this](const std::string &k) {
      return backing_.read(k);
    });
    ON_CALL(*this, write(_, _))
        .WillByDefault([this](const std::string &k, const std::string &b) {
          backing_.write(k, b);
        });
    ON_CALL(*this, create(_, _))
        .WillByDefault([this](const std::string &k, const std::string &b) {
          return backing_.create(k, b);
        });
    ON_CALL(*this, exists(_)).WillByDefault([this](const std::string &k) {
      return backing_.exists(k);
    });
    ON_CALL(*this, list(_)).WillByDefault([this](const std::string &p) {
      return backing_.list(p);
    });
    ON_CALL(*this, resolve(_)).WillByDefault([this](const std::string &k) {
      return backing_.resolve(k);
    });
  }

  MOCK_METHOD(std::optional<std::string>, read, (const std::string &key),
              (override));
  MOCK_METHOD(void, write, (const std::string &key, const std::string &bytes),
              (override));
  MOCK_METHOD(bool, create, (const std::string &key, const std::string &bytes),
              (override));
  MOCK_METHOD(bool, exists, (const std::string &key), (override));
  MOCK_METHOD(std::vector<std::string>, list, (const std::string &prefix),
              (override));
  MOCK_METHOD(std::string, resolve, (const std::string &key),
              (const, override));

  InMemoryStorage &backing() { return backing_; }

private:
  InMemoryStorage backing_;
};

#endif // TESTS_MOCKS_MOCK_STORAGE_H
