#ifndef __WT_PENDING_REQUEST_CORRELATOR__
#define __WT_PENDING_REQUEST_CORRELATOR__

#include "Clock.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionError.hpp"

namespace wt {
typedef std::function<void(const json&)> ResolveHandler;

/**
 * @brief Matches asynchronous replies to the request that caused them.
 *
 * Entries are keyed by (session id, resource key).  At most one entry exists
 * per key; every entry is settled exactly once, by a reply, a rejection, its
 * deadline or session teardown.  Handlers run after the entry is removed, so
 * they may issue new requests for the same key.
 */
class PendingRequestCorrelator {
 public:
  explicit PendingRequestCorrelator(shared_ptr<Clock> _clock);

  /**
   * @brief Registers a request.  If `key` is already pending for the session
   * the new caller is rejected with DUPLICATE_REQUEST, the existing entry is
   * kept and false is returned.
   */
  bool waitFor(const string& sessionId, const string& key, int64_t timeoutMs,
               ResolveHandler onResolve, ErrorHandler onReject);

  /** @brief Settles the entry for `key`.  Returns false for late replies. */
  bool resolve(const string& sessionId, const string& key, const json& value);

  /** @brief Settles the oldest entry whose key starts with `prefix`. */
  bool resolveFirst(const string& sessionId, const string& prefix,
                    const json& value);

  bool reject(const string& sessionId, const string& key,
              const SessionError& error);

  /** @brief Rejects every entry whose key starts with `prefix`. */
  int rejectMatching(const string& sessionId, const string& prefix,
                     const SessionError& error);

  int rejectAll(const string& sessionId, const SessionError& error);

  /** @brief Rejects overdue entries with TIMEOUT.  Returns how many. */
  int expire();

  int pendingCount(const string& sessionId) const;

  bool isPending(const string& sessionId, const string& key) const {
    return pending.find(make_pair(sessionId, key)) != pending.end();
  }

 protected:
  struct PendingRequest {
    ResolveHandler onResolve;
    ErrorHandler onReject;
    int64_t deadline;
    int64_t sequence;
  };
  typedef pair<string, string> RequestKey;

  vector<PendingRequest> takeMatching(const string& sessionId,
                                      const string& prefix);

  shared_ptr<Clock> clock;
  map<RequestKey, PendingRequest> pending;
  int64_t nextSequence;
};
}  // namespace wt

#endif  // __WT_PENDING_REQUEST_CORRELATOR__
