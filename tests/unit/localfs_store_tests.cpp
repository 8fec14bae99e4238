#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>

#include "iolat/core/error.hpp"
#include "iolat/store/store.hpp"

namespace {

const std::filesystem::path kRoot = "./iolat_test_store_out";

std::unique_ptr<iolat::IStoreClient> fresh_store() {
  std::error_code ec;
  std::filesystem::remove_all(kRoot, ec);
  iolat::StoreConfig cfg{};
  cfg.root_dir = kRoot.string();
  auto store = iolat::make_store(cfg);
  store->init();
  return store;
}

bool test_init_idempotent() {
  auto store = fresh_store();
  try {
    store->init();
    store->init();
  } catch (const iolat::Error& e) {
    std::cerr << std::format("repeated init failed: {}\n", e.what());
    return false;
  }
  if (store->kind() != iolat::StoreKind::LocalFs) {
    std::cerr << std::format("store kind mismatch\n");
    return false;
  }
  if (store->describe().find("iolat_") == std::string::npos) {
    std::cerr << std::format("describe() lacks prefix: {}\n", store->describe());
    return false;
  }
  return true;
}

bool test_unique_keys() {
  auto store = fresh_store();
  std::unordered_set<std::string> keys;
  constexpr int kKeys = 10000;
  for (int i = 0; i < kKeys; ++i) {
    if (!keys.insert(store->gen_unique_key()).second) {
      std::cerr << std::format("duplicate key after {} calls\n", i);
      return false;
    }
  }
  return true;
}

bool test_roundtrip() {
  auto store = fresh_store();
  const auto handler = store->handler();

  std::string payload(200'000, '\0');
  for (size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<char>('a' + (i % 26));
  }
  payload[17] = '\0';

  const auto key = store->gen_unique_key();
  try {
    handler->write(key, payload);
    if (handler->read(key) != payload) {
      std::cerr << std::format("read-back mismatch for {}\n", key);
      return false;
    }
    handler->write(key, "short");
    if (handler->read(key) != "short") {
      std::cerr << std::format("overwrite did not truncate {}\n", key);
      return false;
    }
    handler->write(key, "");
    if (!handler->read(key).empty()) {
      std::cerr << std::format("empty value not preserved for {}\n", key);
      return false;
    }
    handler->remove(key);
  } catch (const iolat::Error& e) {
    std::cerr << std::format("roundtrip failed: {}\n", e.what());
    return false;
  }
  return true;
}

bool test_tombstone() {
  auto store = fresh_store();
  const auto handler = store->handler();
  const auto key = store->gen_unique_key();

  handler->write(key, "Hello World");
  handler->remove(key);

  bool read_failed = false;
  try {
    static_cast<void>(handler->read(key));
  } catch (const iolat::BackendError& e) {
    read_failed = e.code() == iolat::ErrorCode::NotFound && e.key() == key && e.op() == "open" &&
                  !e.cause().empty();
  }
  if (!read_failed) {
    std::cerr << std::format("read after delete did not fail with not_found\n");
    return false;
  }

  bool delete_failed = false;
  try {
    handler->remove(key);
  } catch (const iolat::BackendError& e) {
    delete_failed = e.code() == iolat::ErrorCode::NotFound && e.op() == "delete" &&
                    std::string(e.what()).starts_with("delete " + key + ": ");
  }
  if (!delete_failed) {
    std::cerr << std::format("delete of a missing key did not fail\n");
    return false;
  }
  return true;
}

bool test_write_without_init_fails() {
  std::error_code ec;
  std::filesystem::remove_all(kRoot, ec);
  iolat::StoreConfig cfg{};
  cfg.root_dir = kRoot.string();
  auto store = iolat::make_store(cfg);

  bool failed = false;
  try {
    store->handler()->write(store->gen_unique_key(), "x");
  } catch (const iolat::BackendError& e) {
    failed = e.op() == "create";
  }
  if (!failed) {
    std::cerr << std::format("write into a missing namespace should fail\n");
    return false;
  }
  return true;
}

bool test_shared_handler() {
  auto store = fresh_store();
  if (store->handler() != store->handler()) {
    std::cerr << std::format("localfs handler should be shared\n");
    return false;
  }
  return true;
}

bool test_invalid_config() {
  iolat::StoreConfig cfg{};
  cfg.root_dir.clear();
  bool rejected = false;
  try {
    static_cast<void>(iolat::make_store(cfg));
  } catch (const iolat::Error& e) {
    rejected = e.code() == iolat::ErrorCode::InvalidArgument;
  }
  if (!rejected) {
    std::cerr << std::format("expected invalid argument for empty root dir\n");
    return false;
  }
  return true;
}

}  // namespace

int main() {
  const bool ok = test_init_idempotent() && test_unique_keys() && test_roundtrip() &&
                  test_tombstone() && test_write_without_init_fails() && test_shared_handler() &&
                  test_invalid_config();
  std::error_code ec;
  std::filesystem::remove_all(kRoot, ec);
  return ok ? 0 : 1;
}
