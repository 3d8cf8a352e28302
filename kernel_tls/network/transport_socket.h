#pragma once

#include <cstdint>
#include <memory>

#include "kernel_tls/api/io_error.h"
#include "kernel_tls/common/platform.h"
#include "kernel_tls/common/pure.h"

#include "absl/strings/cord.h"
#include "absl/types/optional.h"

namespace KernelTls {
namespace Network {

/**
 * Action that should occur on a connection after I/O.
 */
enum class PostIoAction {
  // Close the connection.
  Close,
  // Keep the connection open.
  KeepOpen
};

/**
 * Result of each I/O event.
 */
struct IoResult {
  IoResult(PostIoAction action, uint64_t bytes_processed, bool end_stream_read)
      : action_(action), bytes_processed_(bytes_processed), end_stream_read_(end_stream_read),
        err_code_(absl::nullopt) {}

  IoResult(PostIoAction action, uint64_t bytes_processed, bool end_stream_read,
           absl::optional<Api::IoError::IoErrorCode> err_code)
      : action_(action), bytes_processed_(bytes_processed), end_stream_read_(end_stream_read),
        err_code_(err_code) {}

  PostIoAction action_;

  /**
   * Number of bytes processed by the I/O event.
   */
  uint64_t bytes_processed_;

  /**
   * True if an end-of-stream was read from a connection. This
   * can only be true for read operations.
   */
  bool end_stream_read_;

  /**
   * The underlying I/O error code for the failure, if any.
   */
  absl::optional<Api::IoError::IoErrorCode> err_code_;
};

enum class ConnectionEvent { RemoteClose, LocalClose, Connected };

/**
 * Callbacks used by transport socket instances to reach the connection that owns them.
 */
class TransportSocketCallbacks {
public:
  virtual ~TransportSocketCallbacks() = default;

  /**
   * @return the raw socket descriptor of the connection.
   */
  virtual os_fd_t fd() const PURE;

  /**
   * Raise a connection event to the connection.
   * @param event supplies the connection event.
   */
  virtual void raiseEvent(ConnectionEvent event) PURE;
};

/**
 * A transport socket that does actual read / write. It can also do some transformations on
 * the data (e.g. TLS record protection).
 */
class TransportSocket {
public:
  virtual ~TransportSocket() = default;

  /**
   * Called by connection once to initialize the transport socket callbacks that the transport
   * socket should use.
   * @param callbacks supplies the callbacks instance.
   */
  virtual void setTransportSocketCallbacks(TransportSocketCallbacks& callbacks) PURE;

  /**
   * @return bool whether the socket can be flushed and closed.
   */
  virtual bool canFlushClose() PURE;

  /**
   * Closes the transport socket.
   * @param event supplies the connection event that is closing the socket.
   */
  virtual void closeSocket(ConnectionEvent event) PURE;

  /**
   * @param buffer supplies the buffer to read to.
   * @return IoResult the result of the read action.
   */
  virtual IoResult doRead(absl::Cord& buffer) PURE;

  /**
   * @param buffer supplies the buffer to write from. Written bytes are drained from it.
   * @param end_stream supplies whether this is the end of the stream. If true and all
   *        data in buffer is written, the connection will be half-closed.
   * @return IoResult the result of the write action.
   */
  virtual IoResult doWrite(absl::Cord& buffer, bool end_stream) PURE;

  /**
   * Called when underlying transport is established.
   */
  virtual void onConnected() PURE;
};

using TransportSocketPtr = std::unique_ptr<TransportSocket>;

/**
 * Creates transport sockets, one per connection.
 */
class TransportSocketFactory {
public:
  virtual ~TransportSocketFactory() = default;

  /**
   * @return a new transport socket for a connection.
   */
  virtual TransportSocketPtr createTransportSocket() const PURE;
};

using TransportSocketFactoryPtr = std::unique_ptr<TransportSocketFactory>;

} // namespace Network
} // namespace KernelTls
