#include "discovery/discovery_coordinator.hpp"

#include "discovery/results_queue.hpp"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace camscout::discovery {

namespace {

using EndpointKey = std::pair<std::string, std::uint16_t>;

// A validated result replaces the held one when its protocol is more specific,
// or equally specific and earlier in generation order.
bool Supersedes(const ProbeResult& candidate, const ProbeResult& held) {
  const int candidate_rank = ProtocolSpecificity(candidate.protocol);
  const int held_rank = ProtocolSpecificity(held.protocol);
  if (candidate_rank != held_rank) {
    return candidate_rank > held_rank;
  }
  return candidate.candidate.index < held.candidate.index;
}

std::string CountText(std::uint64_t value) {
  return std::to_string(value);
}

} // namespace

struct DiscoveryCoordinator::ScanRun {
  std::uint64_t id = 0;
  ScanRequest request;
  std::atomic<bool> cancel{false};

  mutable std::mutex mutex;
  mutable std::condition_variable finished_cv;
  ScanJob job;
  bool finished = false;

  ResultsQueue<ProbeResult> results;
  std::thread supervisor;
};

DiscoveryCoordinator::DiscoveryCoordinator(std::shared_ptr<const IProbeExecutor> executor,
                                           std::shared_ptr<CameraRegistry> registry,
                                           core::logging::Logger* logger, ScanObserver* observer)
    : executor_(std::move(executor)), registry_(std::move(registry)), logger_(logger),
      observer_(observer) {
  if (!registry_) {
    registry_ = std::make_shared<CameraRegistry>();
  }
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
  std::vector<std::shared_ptr<ScanRun>> runs;
  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    if (current_) {
      CancelRun(*current_, "shutdown");
      runs.push_back(current_);
    }
    runs.insert(runs.end(), retired_.begin(), retired_.end());
  }
  for (const auto& run : runs) {
    if (run->supervisor.joinable()) {
      run->supervisor.join();
    }
  }
}

std::uint64_t DiscoveryCoordinator::StartScan(const ScanRequest& request) {
  auto run = std::make_shared<ScanRun>();
  run->request = request;
  if (run->request.concurrency == 0U) {
    run->request.concurrency = 1U;
  }

  std::string spawn_error;
  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    ReapFinishedLocked();
    if (current_) {
      CancelRun(*current_, "superseded");
      retired_.push_back(current_);
    }

    run->id = next_id_++;
    run->job.id = run->id;
    run->job.state = ScanState::kRunning;
    run->job.started_at = std::chrono::system_clock::now();
    current_ = run;

    try {
      run->supervisor = std::thread([this, run] { Supervise(run); });
    } catch (const std::system_error& ex) {
      spawn_error = std::string("failed to start scan thread: ") + ex.what();
    }
  }

  if (!spawn_error.empty()) {
    FailRun(*run, spawn_error);
    FinishRun(*run);
  }
  return run->id;
}

ScanJob DiscoveryCoordinator::Status() const {
  std::shared_ptr<ScanRun> run;
  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    run = current_;
  }
  if (!run) {
    return ScanJob{};
  }
  std::lock_guard<std::mutex> lock(run->mutex);
  return run->job;
}

void DiscoveryCoordinator::Cancel() {
  std::lock_guard<std::mutex> lock(runs_mutex_);
  if (current_) {
    CancelRun(*current_, "cancel requested");
  }
}

bool DiscoveryCoordinator::Wait(const std::uint64_t job_id,
                                const std::chrono::milliseconds timeout) const {
  const std::shared_ptr<ScanRun> run = FindRun(job_id);
  if (!run) {
    // Reaped runs had already finished.
    std::lock_guard<std::mutex> lock(runs_mutex_);
    return job_id != 0U && job_id < next_id_;
  }
  std::unique_lock<std::mutex> lock(run->mutex);
  return run->finished_cv.wait_for(lock, timeout, [&run] { return run->finished; });
}

const CameraRegistry& DiscoveryCoordinator::Registry() const {
  return *registry_;
}

std::shared_ptr<DiscoveryCoordinator::ScanRun>
DiscoveryCoordinator::FindRun(const std::uint64_t job_id) const {
  std::lock_guard<std::mutex> lock(runs_mutex_);
  if (current_ && current_->id == job_id) {
    return current_;
  }
  const auto it = std::find_if(retired_.begin(), retired_.end(),
                               [job_id](const auto& run) { return run->id == job_id; });
  return it == retired_.end() ? nullptr : *it;
}

void DiscoveryCoordinator::ReapFinishedLocked() {
  auto it = retired_.begin();
  while (it != retired_.end()) {
    bool finished = false;
    {
      std::lock_guard<std::mutex> run_lock((*it)->mutex);
      finished = (*it)->finished;
    }
    if (!finished) {
      ++it;
      continue;
    }
    if ((*it)->supervisor.joinable()) {
      (*it)->supervisor.join();
    }
    it = retired_.erase(it);
  }
}

void DiscoveryCoordinator::CancelRun(ScanRun& run, const char* reason) {
  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(run.mutex);
    if (run.job.state == ScanState::kRunning) {
      run.job.state = ScanState::kCancelled;
      run.job.finished_at = std::chrono::system_clock::now();
      cancelled = true;
    }
  }
  run.cancel.store(true);
  run.results.Interrupt();
  if (cancelled && logger_ != nullptr) {
    logger_->Info("scan cancelled", {{"scan_id", std::to_string(run.id)}, {"reason", reason}});
  }
}

void DiscoveryCoordinator::FailRun(ScanRun& run, const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(run.mutex);
    if (run.job.state != ScanState::kRunning) {
      return;
    }
    run.job.state = ScanState::kFailed;
    run.job.finished_at = std::chrono::system_clock::now();
    run.job.failure_reason = reason;
    run.job.error_counts[ErrorKind::kScanPrerequisiteFailed] += 1U;
  }
  if (logger_ != nullptr) {
    logger_->Error("scan failed", {{"scan_id", std::to_string(run.id)},
                                   {"error_kind", ToString(ErrorKind::kScanPrerequisiteFailed)},
                                   {"reason", reason}});
  }
}

void DiscoveryCoordinator::FinishRun(ScanRun& run) {
  ScanJob snapshot;
  {
    std::lock_guard<std::mutex> lock(run.mutex);
    snapshot = run.job;
  }
  if (observer_ != nullptr) {
    observer_->OnScanFinished(snapshot);
  }
  {
    std::lock_guard<std::mutex> lock(run.mutex);
    run.finished = true;
  }
  run.finished_cv.notify_all();
}

void DiscoveryCoordinator::Supervise(const std::shared_ptr<ScanRun>& run) {
  const ScanRequest& request = run->request;
  const std::string scan_id = std::to_string(run->id);

  CandidateSpace space;
  std::string error;
  if (!BuildCandidateSpace(request.targets, request.ports, request.paths, request.max_hosts, space,
                           error)) {
    FailRun(*run, error);
    FinishRun(*run);
    return;
  }

  ScanJob snapshot;
  {
    std::lock_guard<std::mutex> lock(run->mutex);
    run->job.candidates_total = space.Size();
    snapshot = run->job;
  }
  if (logger_ != nullptr) {
    logger_->Info("scan started", {{"scan_id", scan_id},
                                   {"targets", request.targets},
                                   {"candidates_total", CountText(space.Size())},
                                   {"concurrency", CountText(request.concurrency)}});
  }
  if (observer_ != nullptr && snapshot.state == ScanState::kRunning) {
    observer_->OnScanStarted(snapshot);
  }

  // Fan-out: each worker pulls the next candidate in generation order.
  const std::uint64_t pool_size =
      space.Empty()
          ? 0U
          : std::max<std::uint64_t>(1U, std::min<std::uint64_t>(request.concurrency, space.Size()));
  std::mutex cursor_mutex;
  CandidateSpace::Cursor cursor = space.Begin();
  // One extra reference held by this thread until every worker is spawned.
  std::atomic<std::uint64_t> live_producers{pool_size + 1U};
  const auto release_producer = [&run, &live_producers] {
    if (live_producers.fetch_sub(1U) == 1U) {
      run->results.Close();
    }
  };

  std::vector<std::thread> workers;
  if (pool_size > 0U) {
    workers.reserve(static_cast<std::size_t>(pool_size));
    for (std::uint64_t i = 0; i < pool_size; ++i) {
      try {
        workers.emplace_back([this, &run, &request, &cursor, &cursor_mutex, &release_producer] {
          CameraCandidate candidate;
          while (!run->cancel.load()) {
            {
              std::lock_guard<std::mutex> lock(cursor_mutex);
              if (!cursor.Next(candidate)) {
                break;
              }
            }
            run->results.Push(executor_->Probe(candidate, request.probe_timeout, run->cancel));
          }
          release_producer();
        });
      } catch (const std::system_error& ex) {
        if (logger_ != nullptr) {
          logger_->Warn("probe worker could not be started",
                        {{"scan_id", scan_id}, {"error", ex.what()}});
        }
        live_producers.fetch_sub(pool_size - i);
        break;
      }
    }
    if (workers.empty()) {
      FailRun(*run, "no probe worker could be started");
    }
  }
  release_producer();

  // Fan-in: the only place job counters and the dedup map change.
  std::map<EndpointKey, ProbeResult> confirmed;
  while (!run->cancel.load()) {
    std::optional<ProbeResult> result = run->results.WaitPop(kAbortPollInterval);
    if (!result.has_value()) {
      if (run->results.Drained()) {
        break;
      }
      continue;
    }

    if (result->validated) {
      const EndpointKey key{result->candidate.host, result->candidate.port};
      const auto it = confirmed.find(key);
      if (it == confirmed.end()) {
        confirmed.emplace(key, *result);
      } else if (Supersedes(*result, it->second)) {
        it->second = *result;
      }
    }

    bool running = false;
    {
      std::lock_guard<std::mutex> lock(run->mutex);
      running = run->job.state == ScanState::kRunning;
      if (running) {
        ++run->job.candidates_checked;
        run->job.cameras_found = confirmed.size();
        if (IsUnconfirmed(*result)) {
          ++run->job.cameras_unconfirmed;
        }
        if (result->error.has_value()) {
          run->job.error_counts[*result->error] += 1U;
        }
        snapshot = run->job;
      }
    }
    if (running && observer_ != nullptr) {
      observer_->OnProbeResult(snapshot, *result);
    }
  }

  for (auto& worker : workers) {
    worker.join();
  }

  std::vector<DiscoveredCamera> cameras;
  cameras.reserve(confirmed.size());
  for (const auto& [key, result] : confirmed) {
    DiscoveredCamera camera = MakeDiscoveredCamera(result);
    const std::optional<DiscoveredCamera> previous = registry_->Find(key.first, key.second);
    if (previous.has_value()) {
      camera.discovered_at = previous->discovered_at;
    }
    cameras.push_back(std::move(camera));
  }

  bool completed = false;
  {
    std::lock_guard<std::mutex> lock(run->mutex);
    if (run->job.state == ScanState::kRunning && !run->cancel.load()) {
      registry_->Replace(std::move(cameras));
      run->job.state = ScanState::kCompleted;
      run->job.finished_at = std::chrono::system_clock::now();
      run->job.cameras_found = confirmed.size();
      completed = true;
    }
    snapshot = run->job;
  }

  if (completed && logger_ != nullptr) {
    logger_->Info("scan completed",
                  {{"scan_id", scan_id},
                   {"candidates_checked", CountText(snapshot.candidates_checked)},
                   {"cameras_found", CountText(snapshot.cameras_found)},
                   {"cameras_unconfirmed", CountText(snapshot.cameras_unconfirmed)}});
  }
  FinishRun(*run);
}

} // namespace camscout::discovery
