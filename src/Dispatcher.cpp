#include "cusplit/Dispatcher.hpp"

#include "cusplit/MessageComposer.hpp"
#include "cusplit/TextNormalizer.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace cusplit {

namespace {

std::string lowercase(const std::string &text) {
  std::string result = text;
  for (char &c : result) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return result;
}

struct Job {
  size_t logIndex;
  const DeliveryItem *item;
};

} // namespace

const char *toString(DeliveryStatus status) {
  switch (status) {
  case DeliveryStatus::Pending:
    return "Pending";
  case DeliveryStatus::Sent:
    return "Sent";
  case DeliveryStatus::Failed:
    return "Failed";
  }
  return "Unknown";
}

std::string deliveryKey(const CertificateRecord &record,
                        const std::string &recipient) {
  return record.id() + "|" + lowercase(trim(recipient));
}

std::vector<DeliveryItem>
deliveryItemsFrom(const ReconciliationResult &result,
                  const std::vector<CertificateRecord> &records,
                  const Roster &roster) {
  std::vector<DeliveryItem> items;
  for (const auto &entry : result.entries) {
    bool matched = entry.decision == MatchDecision::Exact ||
                   entry.decision == MatchDecision::Fuzzy;
    if (!matched || entry.recordIndex < 0 || entry.rosterIndex < 0) {
      continue;
    }

    const RosterEntry &recipient = roster.at(static_cast<size_t>(entry.rosterIndex));
    if (recipient.email.empty()) {
      continue;
    }

    DeliveryItem item;
    item.record = records.at(static_cast<size_t>(entry.recordIndex));
    item.recipient = recipient.email;
    item.decision = entry.decision;
    items.push_back(item);
  }
  return items;
}

Dispatcher::Dispatcher() : Dispatcher(DispatchConfig()) {}

Dispatcher::Dispatcher(const DispatchConfig &config) : m_config(config) {
  if (m_config.workers == 0) {
    throw std::invalid_argument("Dispatcher needs at least one worker");
  }
  if (m_config.subjectTemplate.empty()) {
    m_config.subjectTemplate = kDefaultSubjectTemplate;
  }
  if (m_config.bodyTemplate.empty()) {
    m_config.bodyTemplate = defaultBodyTemplate();
  }
}

const DispatchConfig &Dispatcher::getConfig() const { return m_config; }

std::string Dispatcher::ineligibilityReason(const DeliveryItem &item) {
  switch (item.decision) {
  case MatchDecision::Unmatched:
    return "Record has no roster match";
  case MatchDecision::OrphanRoster:
    return "Roster entry has no certificate";
  case MatchDecision::Ambiguous:
    if (!item.operatorConfirmed) {
      return "Ambiguous match not resolved by an operator";
    }
    break;
  case MatchDecision::Exact:
  case MatchDecision::Fuzzy:
    break;
  }

  std::string recipient = trim(item.recipient);
  if (recipient.empty()) {
    return "No recipient email";
  }
  if (recipient.find('@') == std::string::npos) {
    return "Malformed recipient email '" + recipient + "'";
  }
  return "";
}

DispatchResult Dispatcher::dispatch(const std::vector<DeliveryItem> &items,
                                    Transport &transport,
                                    AttachmentProvider &attachments,
                                    const std::vector<DeliveryOutcome> &previousLog,
                                    const CancellationToken *token,
                                    const ProgressCallback &progress) const {
  DispatchResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  auto warn = [&](const std::string &message) {
    std::cerr << "WARNING: " << message << std::endl;
    result.warnings.push_back(message);
  };

  // Start from the previous log so Sent entries are carried over untouched
  result.log = previousLog;
  std::unordered_map<std::string, size_t> logPosition;
  for (size_t i = 0; i < result.log.size(); i++) {
    logPosition[result.log[i].key] = i;
  }

  std::vector<Job> jobs;
  std::unordered_set<std::string> batchKeys;

  for (const auto &item : items) {
    std::string reason = ineligibilityReason(item);
    if (!reason.empty()) {
      result.skipped.push_back({item.record.id(), item.recipient, reason});
      continue;
    }

    std::string key = deliveryKey(item.record, item.recipient);
    if (!batchKeys.insert(key).second) {
      result.skipped.push_back(
          {item.record.id(), item.recipient, "Duplicate pair in batch"});
      continue;
    }

    auto known = logPosition.find(key);
    if (known != logPosition.end() &&
        result.log[known->second].status == DeliveryStatus::Sent) {
      result.alreadySent++;
      continue;
    }

    DeliveryOutcome outcome;
    outcome.key = key;
    outcome.recordId = item.record.id();
    outcome.recipient = trim(item.recipient);
    outcome.subject =
        renderTemplate(m_config.subjectTemplate, item.record, m_config.defaultYear);
    outcome.attachmentFilename = outputFilename(item.record);
    outcome.status = DeliveryStatus::Pending;
    outcome.timestamp = std::chrono::system_clock::now();

    size_t index;
    if (known != logPosition.end()) {
      index = known->second;
      result.log[index] = outcome;
    } else {
      index = result.log.size();
      result.log.push_back(outcome);
      logPosition[key] = index;
    }
    jobs.push_back({index, &item});
  }

  for (const auto &skipped : result.skipped) {
    warn("Not sending " + skipped.recordId + " to '" + skipped.recipient +
         "': " + skipped.reason);
  }

  std::mutex logMutex;
  std::atomic<size_t> nextJob{0};
  std::atomic<int> attempted{0};
  int finished = 0;
  const int total = static_cast<int>(jobs.size());

  auto worker = [&]() {
    while (true) {
      if (token && token->isCancelled()) {
        break;
      }
      size_t j = nextJob.fetch_add(1);
      if (j >= jobs.size()) {
        break;
      }

      const Job &job = jobs[j];
      const DeliveryItem &item = *job.item;
      std::string subject;
      std::string filename;
      {
        std::lock_guard<std::mutex> lock(logMutex);
        subject = result.log[job.logIndex].subject;
        filename = result.log[job.logIndex].attachmentFilename;
      }

      bool sent = false;
      std::string failure;
      std::vector<unsigned char> attachment;

      try {
        attachment = attachments.attachmentFor(item.record);
      } catch (const std::exception &e) {
        failure = std::string("Attachment unavailable: ") + e.what();
      } catch (...) {
        failure = "Attachment unavailable: unknown error";
      }

      if (failure.empty()) {
        attempted++;
        try {
          std::string body = renderTemplate(m_config.bodyTemplate, item.record,
                                            m_config.defaultYear);
          SendResult sendResult = transport.send(
              trim(item.recipient), subject, body, attachment, filename);
          sent = sendResult.success;
          if (!sent) {
            failure = sendResult.errorMessage.empty()
                          ? "Transport reported a failure"
                          : sendResult.errorMessage;
          }
        } catch (const std::exception &e) {
          failure = std::string("Transport error: ") + e.what();
        } catch (...) {
          failure = "Transport error: unknown exception";
        }
      }

      int done = 0;
      {
        std::lock_guard<std::mutex> lock(logMutex);
        DeliveryOutcome &outcome = result.log[job.logIndex];
        outcome.status = sent ? DeliveryStatus::Sent : DeliveryStatus::Failed;
        outcome.failureReason = sent ? "" : failure;
        outcome.timestamp = std::chrono::system_clock::now();
        done = ++finished;

        if (sent) {
          if (m_config.verbose) {
            std::cerr << "DEBUG: Sent " << filename << " to " << outcome.recipient
                      << std::endl;
          }
        } else {
          std::cerr << "WARNING: Delivery of " << filename << " to "
                    << outcome.recipient << " failed: " << failure << std::endl;
        }
      }

      // Caller code runs without the log mutex held
      if (progress) {
        bool progressFailed = true;
        std::string progressFailure;
        try {
          progress(done, total);
          progressFailed = false;
        } catch (const std::exception &e) {
          progressFailure = e.what();
        } catch (...) {
          progressFailure = "unknown exception";
        }
        if (progressFailed) {
          std::lock_guard<std::mutex> lock(logMutex);
          warn("Progress callback failed: " + progressFailure);
        }
      }

      if (m_config.pauseBetweenSends.count() > 0 &&
          !(token && token->isCancelled())) {
        std::this_thread::sleep_for(m_config.pauseBetweenSends);
      }
    }
  };

  size_t workerCount = std::min<size_t>(m_config.workers, jobs.size());
  std::vector<std::thread> threads;
  threads.reserve(workerCount);
  for (size_t i = 0; i < workerCount; i++) {
    threads.emplace_back(worker);
  }
  for (auto &thread : threads) {
    thread.join();
  }

  result.attempted = attempted.load();

  int notAttempted = total - finished;
  if (token && token->isCancelled()) {
    result.cancelled = true;
    if (notAttempted > 0) {
      warn("Dispatch cancelled: " + std::to_string(notAttempted) +
           " pair(s) left pending");
    }
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

int countStatus(const std::vector<DeliveryOutcome> &log, DeliveryStatus status) {
  return static_cast<int>(
      std::count_if(log.begin(), log.end(), [status](const DeliveryOutcome &o) {
        return o.status == status;
      }));
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string formatDeliveryLog(const std::vector<DeliveryOutcome> &log) {
  std::ostringstream out;
  out << "status\trecipient\tsubject\tfile\ttimestamp\terror\n";
  for (const auto &outcome : log) {
    out << toString(outcome.status) << "\t" << outcome.recipient << "\t"
        << outcome.subject << "\t" << outcome.attachmentFilename << "\t"
        << formatTimestamp(outcome.timestamp) << "\t"
        << (outcome.failureReason.empty() ? "-" : outcome.failureReason)
        << "\n";
  }
  return out.str();
}

} // namespace cusplit
