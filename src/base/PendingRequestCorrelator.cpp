#include "PendingRequestCorrelator.hpp"

namespace wt {
PendingRequestCorrelator::PendingRequestCorrelator(shared_ptr<Clock> _clock)
    : clock(_clock), nextSequence(0) {}

bool PendingRequestCorrelator::waitFor(const string& sessionId,
                                       const string& key, int64_t timeoutMs,
                                       ResolveHandler onResolve,
                                       ErrorHandler onReject) {
  RequestKey requestKey(sessionId, key);
  if (pending.find(requestKey) != pending.end()) {
    LOG(INFO) << "Duplicate request for " << key << " on " << sessionId;
    if (onReject) {
      onReject(SessionError(SessionErrorKind::DUPLICATE_REQUEST,
                            "A request for " + key + " is already pending"));
    }
    return false;
  }
  PendingRequest request;
  request.onResolve = onResolve;
  request.onReject = onReject;
  request.deadline = clock->now() + timeoutMs;
  request.sequence = nextSequence++;
  pending.insert(make_pair(requestKey, request));
  VLOG(2) << "Waiting for " << key << " on " << sessionId;
  return true;
}

bool PendingRequestCorrelator::resolve(const string& sessionId,
                                       const string& key, const json& value) {
  auto it = pending.find(make_pair(sessionId, key));
  if (it == pending.end()) {
    VLOG(1) << "Dropping reply for " << key << " on " << sessionId
            << ": nothing pending";
    return false;
  }
  PendingRequest request = it->second;
  pending.erase(it);
  if (request.onResolve) {
    request.onResolve(value);
  }
  return true;
}

bool PendingRequestCorrelator::resolveFirst(const string& sessionId,
                                            const string& prefix,
                                            const json& value) {
  auto oldest = pending.end();
  for (auto it = pending.lower_bound(make_pair(sessionId, prefix));
       it != pending.end() && it->first.first == sessionId &&
       startsWith(it->first.second, prefix);
       ++it) {
    if (oldest == pending.end() ||
        it->second.sequence < oldest->second.sequence) {
      oldest = it;
    }
  }
  if (oldest == pending.end()) {
    VLOG(1) << "Dropping reply for " << prefix << "* on " << sessionId
            << ": nothing pending";
    return false;
  }
  PendingRequest request = oldest->second;
  pending.erase(oldest);
  if (request.onResolve) {
    request.onResolve(value);
  }
  return true;
}

bool PendingRequestCorrelator::reject(const string& sessionId,
                                      const string& key,
                                      const SessionError& error) {
  auto it = pending.find(make_pair(sessionId, key));
  if (it == pending.end()) {
    return false;
  }
  PendingRequest request = it->second;
  pending.erase(it);
  if (request.onReject) {
    request.onReject(error);
  }
  return true;
}

vector<PendingRequestCorrelator::PendingRequest>
PendingRequestCorrelator::takeMatching(const string& sessionId,
                                       const string& prefix) {
  vector<PendingRequest> taken;
  auto it = pending.lower_bound(make_pair(sessionId, prefix));
  while (it != pending.end() && it->first.first == sessionId &&
         startsWith(it->first.second, prefix)) {
    taken.push_back(it->second);
    it = pending.erase(it);
  }
  std::sort(taken.begin(), taken.end(),
            [](const PendingRequest& a, const PendingRequest& b) {
              return a.sequence < b.sequence;
            });
  return taken;
}

int PendingRequestCorrelator::rejectMatching(const string& sessionId,
                                             const string& prefix,
                                             const SessionError& error) {
  vector<PendingRequest> taken = takeMatching(sessionId, prefix);
  for (auto& request : taken) {
    if (request.onReject) {
      request.onReject(error);
    }
  }
  return taken.size();
}

int PendingRequestCorrelator::rejectAll(const string& sessionId,
                                        const SessionError& error) {
  int count = rejectMatching(sessionId, "", error);
  if (count) {
    LOG(INFO) << "Rejected " << count << " pending requests on " << sessionId
              << " (" << error << ")";
  }
  return count;
}

int PendingRequestCorrelator::expire() {
  int64_t now = clock->now();
  vector<pair<RequestKey, PendingRequest>> overdue;
  for (auto it = pending.begin(); it != pending.end();) {
    if (it->second.deadline <= now) {
      overdue.push_back(*it);
      it = pending.erase(it);
    } else {
      ++it;
    }
  }
  for (auto& it : overdue) {
    LOG(INFO) << "Request for " << it.first.second << " on " << it.first.first
              << " timed out";
    if (it.second.onReject) {
      it.second.onReject(SessionError(
          SessionErrorKind::TIMEOUT,
          "Timed out waiting for a reply to " + it.first.second));
    }
  }
  return overdue.size();
}

int PendingRequestCorrelator::pendingCount(const string& sessionId) const {
  int count = 0;
  for (auto it = pending.lower_bound(make_pair(sessionId, string()));
       it != pending.end() && it->first.first == sessionId; ++it) {
    count++;
  }
  return count;
}
}  // namespace wt
