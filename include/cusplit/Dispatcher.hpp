#ifndef CUSPLIT_DISPATCHER_HPP
#define CUSPLIT_DISPATCHER_HPP

#include "cusplit/Matcher.hpp"
#include "cusplit/Reconciler.hpp"
#include "cusplit/Records.hpp"
#include "cusplit/Roster.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief Result of one Transport::send call
 */
struct SendResult {
  bool success = false;
  std::string errorMessage; ///< Human readable reason if failed
};

/**
 * @brief Capability to deliver one message with one attachment
 *
 * Called concurrently from the dispatcher's workers. Implementations report
 * failures through SendResult; exceptions are also caught and recorded as a
 * failure of that one recipient.
 */
class Transport {
public:
  virtual ~Transport() = default;

  virtual SendResult send(const std::string &recipient,
                          const std::string &subject, const std::string &body,
                          const std::vector<unsigned char> &attachment,
                          const std::string &attachmentFilename) = 0;
};

/**
 * @brief Supplies the sliced single-certificate document for a record
 *
 * Called concurrently. Throws when the document cannot be produced.
 */
class AttachmentProvider {
public:
  virtual ~AttachmentProvider() = default;

  virtual std::vector<unsigned char>
  attachmentFor(const CertificateRecord &record) = 0;
};

/**
 * @brief Batch-level stop signal: no new sends start once cancelled
 */
class CancellationToken {
public:
  void cancel() { m_cancelled.store(true); }
  bool isCancelled() const { return m_cancelled.load(); }

private:
  std::atomic<bool> m_cancelled{false};
};

enum class DeliveryStatus { Pending, Sent, Failed };

const char *toString(DeliveryStatus status);

/**
 * @brief Delivery state of one (record, recipient) pair
 *
 * Leaves Pending at most once, for Sent or Failed, and never goes back.
 */
struct DeliveryOutcome {
  std::string key;       ///< Pair identity, see deliveryKey()
  std::string recordId;  ///< CertificateRecord::id()
  std::string recipient; ///< Email address
  std::string subject;
  std::string attachmentFilename;
  DeliveryStatus status = DeliveryStatus::Pending;
  std::string failureReason; ///< Set iff status is Failed
  std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief A confirmed (record, recipient) pair handed to the dispatcher
 */
struct DeliveryItem {
  CertificateRecord record;
  std::string recipient;
  MatchDecision decision = MatchDecision::Exact;
  bool operatorConfirmed = false; ///< Operator picked the candidate by hand
};

/**
 * @brief An item refused before any send was attempted
 */
struct SkippedItem {
  std::string recordId;
  std::string recipient;
  std::string reason;
};

/**
 * @brief Configuration options for a dispatch run
 */
struct DispatchConfig {
  unsigned workers = 4; ///< Concurrent sends
  std::chrono::milliseconds pauseBetweenSends{0}; ///< Per worker
  std::string subjectTemplate;  ///< Empty = kDefaultSubjectTemplate
  std::string bodyTemplate;     ///< Empty = defaultBodyTemplate()
  std::string defaultYear;      ///< {anno} for records without a tax year
  bool verbose = false;         ///< Print DEBUG lines to stderr
};

/**
 * @brief Result of a dispatch run
 */
struct DispatchResult {
  std::vector<DeliveryOutcome> log; ///< Authoritative delivery log
  std::vector<SkippedItem> skipped; ///< Items refused up front
  std::vector<std::string> warnings;
  int attempted = 0;       ///< Transport calls made in this run
  int alreadySent = 0;     ///< Pairs skipped because the previous log has them Sent
  bool cancelled = false;  ///< Cancellation stopped the run early
  double processingTimeMs = 0;
};

/// Called after each terminal transition with (finished, total). Worker
/// threads call it concurrently and without holding the log lock; a throw is
/// recorded as a batch warning.
using ProgressCallback = std::function<void(int, int)>;

/**
 * @brief Identity of a (record, recipient) pair: page range and lowercased
 * email, e.g. "p0-2|mario.rossi@email.it"
 */
std::string deliveryKey(const CertificateRecord &record,
                        const std::string &recipient);

/**
 * @brief Build the items for every Exact or Fuzzy entry whose roster entry
 * has an email
 */
std::vector<DeliveryItem>
deliveryItemsFrom(const ReconciliationResult &result,
                  const std::vector<CertificateRecord> &records,
                  const Roster &roster);

/**
 * @brief Sends confirmed certificates through a Transport with a bounded pool
 * of workers and keeps the delivery log
 *
 * Each send is independent: a failure is recorded for that pair only. A
 * re-run with the previous log never re-sends a Sent pair and retries only
 * Failed or never-attempted ones.
 *
 * Example usage:
 * @code
 * cusplit::Dispatcher dispatcher(config);
 * auto first = dispatcher.dispatch(items, transport, attachments);
 * // later, after fixing the mail server
 * auto retry = dispatcher.dispatch(items, transport, attachments, first.log);
 * @endcode
 */
class Dispatcher {
public:
  Dispatcher();

  /**
   * @throws std::invalid_argument if config.workers is 0
   */
  explicit Dispatcher(const DispatchConfig &config);

  /**
   * @brief Deliver every eligible item
   * @param items Confirmed pairs; Unmatched, OrphanRoster, unconfirmed
   * Ambiguous and email-less items are skipped
   * @param transport Message sender
   * @param attachments Source of the per-record PDF bytes
   * @param previousLog Log of an earlier run over the same batch, if any
   * @param token Optional cancellation signal
   * @param progress Optional progress callback
   * @return DispatchResult whose log holds one entry per pair
   */
  DispatchResult dispatch(const std::vector<DeliveryItem> &items,
                          Transport &transport, AttachmentProvider &attachments,
                          const std::vector<DeliveryOutcome> &previousLog = {},
                          const CancellationToken *token = nullptr,
                          const ProgressCallback &progress = nullptr) const;

  /// Reason an item cannot be sent, or an empty string if it can
  static std::string ineligibilityReason(const DeliveryItem &item);

  const DispatchConfig &getConfig() const;

private:
  DispatchConfig m_config;
};

/// Number of log entries with the given status
int countStatus(const std::vector<DeliveryOutcome> &log, DeliveryStatus status);

/// "2026-10-18T09:30:00Z"
std::string formatTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Tab-separated delivery log with a header line
 *
 * Columns: status, recipient, subject, file, timestamp, error.
 */
std::string formatDeliveryLog(const std::vector<DeliveryOutcome> &log);

} // namespace cusplit

#endif // CUSPLIT_DISPATCHER_HPP
