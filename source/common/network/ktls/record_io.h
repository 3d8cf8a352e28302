#pragma once

#include <cstdint>
#include <string>

#include "kernel_tls/api/io_error.h"
#include "kernel_tls/common/platform.h"

#include "source/common/common/logger.h"

#include "absl/types/optional.h"
#include "absl/types/span.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * TLS record content types (RFC 8446 section 5.1).
 */
enum class RecordType : uint8_t {
  ChangeCipherSpec = 20,
  Alert = 21,
  Handshake = 22,
  ApplicationData = 23,
};

/**
 * Alert descriptions the record path understands.
 */
enum class AlertLevel : uint8_t { Warning = 1, Fatal = 2 };
constexpr uint8_t AlertCloseNotify = 0;

enum class RecordErrorReason {
  // The kernel did not attach a TLS_GET_RECORD_TYPE control message.
  MissingRecordType,
  // A record that is neither application data nor alert.
  UnsupportedRecordType,
  // An alert other than close_notify.
  UnsupportedAlert,
  // An alert record with fewer than 2 bytes.
  AlertTooShort,
};

/**
 * Record layer violation on an offloaded socket. These are fatal for the read path.
 */
class RecordIoError : public Api::IoError {
public:
  RecordIoError(RecordErrorReason reason, uint8_t value) : reason_(reason), value_(value) {}

  // Api::IoError
  IoErrorCode getErrorCode() const override { return IoErrorCode::ProtocolError; }
  std::string getErrorDetails() const override;
  int getSystemErrorCode() const override { return EBADMSG; }

  RecordErrorReason reason() const { return reason_; }
  // The offending record type or alert description.
  uint8_t value() const { return value_; }

  static Api::IoErrorPtr create(RecordErrorReason reason, uint8_t value);

private:
  const RecordErrorReason reason_;
  const uint8_t value_;
};

/**
 * Result of one record read. On success result_ holds the payload length and record_type_ the
 * kernel supplied content type. A zero length without error is the end of the stream.
 */
struct RecordFrame {
  RecordFrame(Api::IoCallUint64Result&& result, uint8_t record_type)
      : result_(std::move(result)), record_type_(record_type) {}

  Api::IoCallUint64Result result_;
  uint8_t record_type_;
};

/**
 * Record type aware reads and writes on a socket whose records the kernel protects. The record
 * type travels next to the payload in a one byte SOL_TLS control message.
 */
class RecordIo : public Logger::Loggable<Logger::Id::ktls> {
public:
  /**
   * Receives at most one record into buffer. Would-block is returned as IoErrorCode::Again and the
   * caller re-invokes once the socket is readable.
   */
  static RecordFrame readRecord(os_fd_t fd, absl::Span<uint8_t> buffer);

  /**
   * Reads application data. A close_notify alert is reported as end of stream (zero bytes, no
   * error); any other alert or record type is a ProtocolError.
   */
  static Api::IoCallUint64Result readDataRecord(os_fd_t fd, absl::Span<uint8_t> buffer);

  /**
   * Sends payload as one record of the given type.
   * @return the bytes sent, or Again when the socket buffer is full.
   */
  static Api::IoCallUint64Result writeTaggedRecord(os_fd_t fd, RecordType type,
                                                   absl::Span<const uint8_t> payload);

  /**
   * Sends a warning level close_notify alert.
   */
  static Api::IoCallUint64Result sendCloseNotify(os_fd_t fd);

  /**
   * @return the reason if err is a record layer error.
   */
  static absl::optional<RecordErrorReason> recordErrorReason(const Api::IoError& err);
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
