#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "iolat/core/types.hpp"

namespace iolat {

// Stateless operations against one backend. Implementations are reentrant:
// a single handler may be shared by every concurrent operation sequence.
// Failures throw BackendError (ErrorCode::NotFound for a missing object).
class IStoreHandler {
 public:
  virtual ~IStoreHandler() = default;

  virtual void write(const std::string& key, std::string_view value) const = 0;
  virtual std::string read(const std::string& key) const = 0;
  virtual void remove(const std::string& key) const = 0;
};

// Lifecycle and key generation for one backend. Not thread-safe: callers
// serialize every call, gen_unique_key() in particular.
class IStoreClient {
 public:
  virtual ~IStoreClient() = default;

  virtual StoreKind kind() const noexcept = 0;
  virtual std::string describe() const = 0;

  // Idempotent. Throws Error{IoError} when the backend cannot be prepared.
  virtual void init() = 0;

  // Never returns a key previously returned by the same instance.
  virtual std::string gen_unique_key() = 0;

  virtual std::shared_ptr<const IStoreHandler> handler() const = 0;
};

std::unique_ptr<IStoreClient> make_localfs_store(const StoreConfig&);
std::unique_ptr<IStoreClient> make_store(const StoreConfig&);

}  // namespace iolat
