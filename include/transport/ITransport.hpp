#pragma once

#include <memory>
#include <string>

#include "common/Types.hpp"
#include "transport/TransportOptions.hpp"

namespace netprov::transport {

/// Live connection to one device. Owned exclusively by one deployment attempt.
///
/// Implementations map every native error into the common failure kinds:
///   stage   → common::StageError
///   commit  → common::CommitError (rolledBack() only on confirmed restore)
///   discard → common::DiscardError
///   close   → common::CloseError
/// A timeout is reported as the failure kind of the operation that timed out.
class ITransportSession {
 public:
  virtual ~ITransportSession() = default;

  virtual void stage(const std::string& sConfig, common::StageMode mode) = 0;

  /// Pending change as text. Empty means nothing would change.
  virtual std::string diff() = 0;

  virtual void commit() = 0;
  virtual void discard() = 0;
  virtual common::DeviceFacts facts() = 0;

  /// Idempotent.
  virtual void close() = 0;
};

/// Pure abstract interface for one vendor family's management protocol.
class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual std::string name() const = 0;

  /// Throws common::ConnectionError on refusal, auth failure or timeout.
  virtual std::unique_ptr<ITransportSession> open(const common::DeviceTarget& dtTarget,
                                                  const common::Credentials& crCreds,
                                                  const TransportOptions& toOptions) = 0;
};

}  // namespace netprov::transport
