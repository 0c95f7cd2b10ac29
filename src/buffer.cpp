#include "lectern/buffer.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <thread>

#include "lectern/observability.hpp"

namespace lectern {

std::string to_string(ConveyorPhase phase) {
  switch (phase) {
    case ConveyorPhase::startup: return "STARTUP";
    case ConveyorPhase::steady: return "STEADY";
  }
  return "UNKNOWN";
}

ConveyorPhase next_phase(ConveyorPhase current, bool entered_center_slot) {
  if (current == ConveyorPhase::startup && entered_center_slot) return ConveyorPhase::steady;
  return current;
}

// ---------------------------------------------------------------------------
// MaterializationWorker - single background thread draining a FIFO of jobs
// ---------------------------------------------------------------------------
// Jobs are assembled outside any lock and handed to the completion callback.
// Queued jobs from an older generation can be dropped with cancel_before(); a
// job already running always completes and is filtered by the callback.
class MaterializationWorker {
 public:
  struct Job {
    uint64_t generation{0};
    WindowIndex window;
    ChapterIndex first;
    ChapterIndex last;
  };

  using Completion = std::function<void(const Job&, std::optional<WindowData>, uint64_t,
                                        const std::string&)>;

  MaterializationWorker(std::shared_ptr<IWindowAssembler> assembler, Completion on_done)
      : assembler_(std::move(assembler)), on_done_(std::move(on_done)) {
    worker_ = std::thread([this] { worker_loop(); });
  }

  ~MaterializationWorker() { stop(); }

  void submit(Job job) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_) return;
      queue_.push_back(job);
    }
    cv_.notify_one();
  }

  void cancel_before(uint64_t generation) {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                [generation](const Job& j) { return j.generation < generation; }),
                 queue_.end());
    if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
  }

  bool wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return idle_cv_.wait_for(lock, timeout,
                             [this] { return stopping_ || (queue_.empty() && running_ == 0); });
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopping_ = true;
      queue_.clear();
    }
    cv_.notify_all();
    idle_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
  }

 private:
  void worker_loop() {
    for (;;) {
      Job job;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (stopping_) return;
        job = queue_.front();
        queue_.pop_front();
        ++running_;
      }

      std::optional<WindowData> data;
      std::string error;
      uint64_t duration_ns = 0;
      {
        ScopeTimer timer(duration_ns);
        try {
          data = assembler_->assemble_window(job.window, job.first, job.last);
          if (!data) error = "assembler returned no content";
        } catch (const std::exception& e) {
          data.reset();
          error = e.what();
        }
      }
      on_done_(job, std::move(data), duration_ns, error);

      {
        std::lock_guard<std::mutex> lock(mu_);
        --running_;
        if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
      }
    }
  }

  std::shared_ptr<IWindowAssembler> assembler_;
  Completion on_done_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<Job> queue_;
  size_t running_{0};
  bool stopping_{false};
  std::thread worker_;
};

// ---------------------------------------------------------------------------
// WindowBufferManager
// ---------------------------------------------------------------------------

namespace {

std::string join_windows(const std::deque<WindowIndex>& windows) {
  std::string out = "[";
  for (size_t i = 0; i < windows.size(); ++i) {
    if (i) out += ",";
    out += std::to_string(windows[i].value);
  }
  out += "]";
  return out;
}

}  // namespace

WindowBufferManager::WindowBufferManager(WindowIndexer indexer,
                                         std::shared_ptr<IWindowAssembler> assembler,
                                         BufferConfig config)
    : indexer_(indexer), assembler_(std::move(assembler)), config_(config) {
  if (!assembler_) {
    throw EngineError(ErrorCode::invalid_config, "window assembler is required");
  }
  if (config_.edge_threshold_pages < 1) {
    throw EngineError(ErrorCode::invalid_config, "edge_threshold_pages must be at least 1");
  }
  if (config_.backward_cooldown.count() < 0) {
    throw EngineError(ErrorCode::invalid_config, "backward_cooldown must not be negative");
  }
  for (double t : {config_.forward_preload_threshold, config_.backward_preload_threshold}) {
    if (!(t >= 0.0 && t <= 1.0)) {
      throw EngineError(ErrorCode::invalid_config, "preload thresholds must be within [0, 1]");
    }
  }
  worker_ = std::make_unique<MaterializationWorker>(
      assembler_, [this](const MaterializationWorker::Job& job, std::optional<WindowData> data,
                         uint64_t duration_ns, const std::string& error) {
        on_materialized(job.generation, job.window, std::move(data), duration_ns, error);
      });
}

WindowBufferManager::~WindowBufferManager() { worker_->stop(); }

void WindowBufferManager::initialize(WindowIndex start_window) {
  std::lock_guard<std::mutex> lk(mu_);
  ++generation_;
  worker_->cancel_before(generation_);
  buffer_.clear();
  cache_.clear();
  in_flight_.clear();
  phase_ = ConveyorPhase::startup;
  active_.reset();
  last_entry_.reset();
  position_.reset();

  const int count = indexer_.window_count();
  if (count == 0) return;
  const int size = std::min(kBufferSize, count);
  const int start = std::clamp(start_window.value, 0, count - size);
  for (int w = start; w < start + size; ++w) buffer_.emplace_back(w);
  active_ = buffer_.front();
  for (WindowIndex w : buffer_) enqueue_locked(w);
}

void WindowBufferManager::on_entered_window(WindowIndex w) {
  std::lock_guard<std::mutex> lk(mu_);
  active_ = w;
  last_entry_ = std::chrono::steady_clock::now();

  const bool at_center = static_cast<int>(buffer_.size()) > kCenterSlot &&
                         buffer_[kCenterSlot] == w;
  const ConveyorPhase next = next_phase(phase_, at_center);
  if (next != phase_) {
    phase_ = next;
    ReaderEvent ev;
    ev.kind = EventKind::phase_transition;
    ev.window = w.value;
    ev.detail = "STARTUP->STEADY";
    emit_event(ev);
  }

  if (in_buffer_locked(w)) enqueue_locked(w);
}

bool WindowBufferManager::shift_forward() {
  std::lock_guard<std::mutex> lk(mu_);
  return shift_locked(true);
}

bool WindowBufferManager::shift_backward() {
  std::lock_guard<std::mutex> lk(mu_);
  return shift_locked(false);
}

bool WindowBufferManager::maybe_shift_forward(int current_in_page, int total_pages_in_window) {
  std::lock_guard<std::mutex> lk(mu_);
  if (total_pages_in_window <= 0) return false;
  if (current_in_page < total_pages_in_window - config_.edge_threshold_pages) return false;
  if (!active_ || static_cast<int>(buffer_.size()) <= kCenterSlot) return false;
  if (*active_ < buffer_[kCenterSlot]) return false;
  return shift_locked(true);
}

bool WindowBufferManager::maybe_shift_backward(int current_in_page) {
  std::lock_guard<std::mutex> lk(mu_);
  if (current_in_page >= config_.edge_threshold_pages) return false;
  // A freshly entered window starts at page 0, which must not read as "near the start".
  if (last_entry_ &&
      std::chrono::steady_clock::now() - *last_entry_ < config_.backward_cooldown) {
    return false;
  }
  if (!active_ || static_cast<int>(buffer_.size()) <= kCenterSlot) return false;
  if (*active_ > buffer_[kCenterSlot]) return false;
  return shift_locked(false);
}

PreloadHint WindowBufferManager::update_position(ChapterIndex chapter, int in_page,
                                                 int total_pages_in_window) {
  if (in_page < 0) {
    throw EngineError(ErrorCode::invalid_index,
                      "in-page index must not be negative, got " + std::to_string(in_page));
  }
  std::lock_guard<std::mutex> lk(mu_);
  if (!active_) return {};

  double progress = 0.0;
  if (total_pages_in_window > 0) {
    progress = std::clamp(static_cast<double>(in_page) / static_cast<double>(total_pages_in_window),
                          0.0, 1.0);
  }
  position_ = ReadingPosition{*active_, chapter, in_page, progress};

  PreloadHint hint;
  if (phase_ == ConveyorPhase::steady) {
    hint.forward = progress >= config_.forward_preload_threshold;
    hint.backward = progress <= config_.backward_preload_threshold;
  }
  return hint;
}

std::optional<ReadingPosition> WindowBufferManager::current_position() const {
  std::lock_guard<std::mutex> lk(mu_);
  return position_;
}

bool WindowBufferManager::is_at_window_boundary(NavigationDirection direction) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!position_ || !active_ || !cache_.contains(*active_)) return false;
  if (direction == NavigationDirection::forward) {
    return position_->progress >= kForwardBoundaryProgress;
  }
  return position_->in_page == 0;
}

std::optional<WindowData> WindowBufferManager::get_cached_window(WindowIndex w) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!in_buffer_locked(w)) return std::nullopt;
  auto it = cache_.find(w);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

bool WindowBufferManager::is_window_in_buffer(WindowIndex w) const {
  std::lock_guard<std::mutex> lk(mu_);
  return in_buffer_locked(w);
}

WindowRenderState WindowBufferManager::render_state(WindowIndex w) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!in_buffer_locked(w)) return WindowRenderState::absent;
  return cache_.contains(w) ? WindowRenderState::ready : WindowRenderState::loading;
}

void WindowBufferManager::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  ++generation_;
  worker_->cancel_before(generation_);
  buffer_.clear();
  cache_.clear();
  in_flight_.clear();
  phase_ = ConveyorPhase::startup;
  active_.reset();
  last_entry_.reset();
  position_.reset();
}

bool WindowBufferManager::wait_until_idle(std::chrono::milliseconds timeout) {
  return worker_->wait_idle(timeout);
}

void WindowBufferManager::set_window_ready_listener(ReadyListener listener) {
  std::lock_guard<std::mutex> lk(mu_);
  ready_listener_ = std::move(listener);
}

ConveyorPhase WindowBufferManager::phase() const {
  std::lock_guard<std::mutex> lk(mu_);
  return phase_;
}

std::vector<WindowIndex> WindowBufferManager::buffered_windows() const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::vector<WindowIndex>(buffer_.begin(), buffer_.end());
}

std::optional<WindowIndex> WindowBufferManager::active_window() const {
  std::lock_guard<std::mutex> lk(mu_);
  return active_;
}

std::optional<WindowIndex> WindowBufferManager::center_window() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (static_cast<int>(buffer_.size()) <= kCenterSlot) return std::nullopt;
  return buffer_[kCenterSlot];
}

size_t WindowBufferManager::cache_size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cache_.size();
}

bool WindowBufferManager::has_next_window() const {
  std::lock_guard<std::mutex> lk(mu_);
  return active_ && active_->value + 1 < indexer_.window_count();
}

bool WindowBufferManager::has_previous_window() const {
  std::lock_guard<std::mutex> lk(mu_);
  return active_ && active_->value > 0;
}

uint64_t WindowBufferManager::generation() const {
  std::lock_guard<std::mutex> lk(mu_);
  return generation_;
}

std::string WindowBufferManager::debug_info() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::string out = "phase=" + to_string(phase_);
  out += " active=" + (active_ ? std::to_string(active_->value) : std::string("none"));
  out += " buffer=" + join_windows(buffer_);
  std::deque<WindowIndex> cached;
  for (const auto& [w, data] : cache_) cached.push_back(w);
  out += " cached=" + join_windows(cached);
  out += " in_flight=" + join_windows(std::deque<WindowIndex>(in_flight_.begin(), in_flight_.end()));
  if (position_) {
    out += " position=" + std::to_string(position_->chapter.value) + ":" +
           std::to_string(position_->in_page);
  }
  out += " generation=" + std::to_string(generation_);
  return out;
}

// ---------------------------------------------------------------------------
// Internals (mu_ held unless noted)
// ---------------------------------------------------------------------------

bool WindowBufferManager::shift_locked(bool forward) {
  if (phase_ == ConveyorPhase::startup || buffer_.empty()) return false;

  WindowIndex dropped;
  WindowIndex revealed;
  if (forward) {
    revealed = buffer_.back().next();
    if (revealed.value >= indexer_.window_count()) return false;
    dropped = buffer_.front();
    buffer_.pop_front();
    buffer_.push_back(revealed);
  } else {
    if (buffer_.front().value <= 0) return false;
    revealed = buffer_.front().prev();
    dropped = buffer_.back();
    buffer_.pop_back();
    buffer_.push_front(revealed);
  }
  // Eviction is synchronous; the revealed window fills in asynchronously.
  cache_.erase(dropped);
  enqueue_locked(revealed);
  enqueue_missing_locked();

  ReaderEvent ev;
  ev.kind = forward ? EventKind::shift_forward : EventKind::shift_backward;
  ev.window = revealed.value;
  ev.detail = "dropped=" + std::to_string(dropped.value) + " buffer=" + join_windows(buffer_);
  emit_event(ev);
  return true;
}

void WindowBufferManager::enqueue_locked(WindowIndex w) {
  if (cache_.contains(w) || in_flight_.contains(w)) return;
  const ChapterRange range = indexer_.chapter_range_for_window(w);
  in_flight_.insert(w);
  worker_->submit(MaterializationWorker::Job{generation_, w, range.first, range.last});
}

void WindowBufferManager::enqueue_missing_locked() {
  for (WindowIndex w : buffer_) enqueue_locked(w);
}

bool WindowBufferManager::in_buffer_locked(WindowIndex w) const {
  // buffer_ is contiguous and ascending.
  return !buffer_.empty() && w >= buffer_.front() && w <= buffer_.back();
}

// Worker thread; takes mu_ itself.
void WindowBufferManager::on_materialized(uint64_t generation, WindowIndex w,
                                          std::optional<WindowData> data, uint64_t duration_ns,
                                          const std::string& error) {
  ReadyListener listener;
  std::optional<WindowData> notify;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ReaderEvent ev;
    ev.window = w.value;
    ev.duration_ns = duration_ns;

    if (generation != generation_) {
      ev.kind = EventKind::materialization_discarded;
      ev.detail = "stale generation " + std::to_string(generation);
      emit_event(ev);
      return;
    }
    in_flight_.erase(w);
    if (!in_buffer_locked(w)) {
      ev.kind = EventKind::materialization_discarded;
      ev.detail = "window left the buffer";
      emit_event(ev);
      return;
    }
    if (!data) {
      // Slot stays empty; the next shift or entry into w retries.
      ev.kind = EventKind::materialization_failed;
      ev.ok = false;
      ev.detail = error;
      emit_event(ev);
      return;
    }

    ev.kind = EventKind::window_materialized;
    ev.detail = data->content_digest;
    emit_event(ev);
    if (ready_listener_) {
      listener = ready_listener_;
      notify = *data;
    }
    cache_.insert_or_assign(w, std::move(*data));
  }
  if (listener && notify) listener(*notify);
}

}  // namespace lectern
