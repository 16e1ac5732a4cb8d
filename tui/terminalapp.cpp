/**
 * @file terminalapp.cpp
 * @brief Implementation of the FTXUI front end
 *
 * Contains:
 * - The message queue feeding AppController::update()
 * - The std::async based effect runner
 * - Animation thread management
 * - Orderly shutdown (cancel, join, save configuration)
 */

#include "terminalapp.hpp"

#include <spdlog/spdlog.h>

TerminalApp::TerminalApp(World world) : m_controller(std::move(world)) {}

/**
 * @brief Destructor ensures no worker outlives the screen it posts to
 */
TerminalApp::~TerminalApp() {
  shutdown();
  stopAnimation();
}

bool TerminalApp::WorkerContext::sleepFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(m_app.m_stop_mutex);
  return !m_app.m_stop_cv.wait_for(lock, duration,
                                   [this] { return m_app.m_stopping; });
}

bool TerminalApp::stopping() {
  std::lock_guard<std::mutex> lock(m_stop_mutex);
  return m_stopping;
}

// ============================================================================
// MESSAGE LOOP
// ============================================================================

void TerminalApp::handle(Message message) {
  m_queue.push_back(std::move(message));
  if (!m_processing)
    drain();
}

void TerminalApp::drain() {
  m_processing = true;
  while (!m_queue.empty()) {
    Message next = std::move(m_queue.front());
    m_queue.pop_front();
    dispatch(m_controller.update(next));
  }
  m_processing = false;

  pruneTasks();
  if (m_controller.quitRequested())
    m_screen.Exit();
}

/**
 * @brief Runs immediate effects inline and everything else in the background
 *
 * Immediate messages are appended to the queue, so they are processed
 * after the message that produced them and in the order they were returned.
 */
void TerminalApp::dispatch(std::vector<Effect> effects) {
  for (auto &effect : effects) {
    if (effect.kind == EffectKind::Immediate) {
      m_queue.push_back(runEffect(effect, m_context));
      continue;
    }
    spawn(std::move(effect));
  }
  if (!m_processing && !m_queue.empty())
    drain();
}

void TerminalApp::spawn(Effect effect) {
  if (stopping())
    return;

  spdlog::debug("starting effect '{}'", effect.label);
  m_tasks.push_back(
      std::async(std::launch::async, [this, effect = std::move(effect)]() {
        Message result = runEffect(effect, m_context);
        if (stopping())
          return;
        m_screen.Post([this, result = std::move(result)]() mutable {
          handle(std::move(result));
        });
        m_screen.PostEvent(Event::Custom);
      }));
}

void TerminalApp::pruneTasks() {
  auto finished = [](std::future<void> &task) {
    return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  };
  for (auto it = m_tasks.begin(); it != m_tasks.end();) {
    if (finished(*it)) {
      it->get();
      it = m_tasks.erase(it);
    } else {
      ++it;
    }
  }
}

// ============================================================================
// ANIMATION
// ============================================================================

/**
 * @brief Starts the animation thread
 *
 * Posts Event::Custom every 100 ms, which makes FTXUI redraw. The event
 * itself is ignored by the input handler.
 */
void TerminalApp::startAnimation() {
  if (m_animating)
    return;
  m_animating = true;
  m_animation_thread = std::thread([this]() {
    while (m_animating) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      if (m_animating)
        m_screen.PostEvent(Event::Custom);
    }
  });
}

void TerminalApp::stopAnimation() {
  m_animating = false;
  if (m_animation_thread.joinable())
    m_animation_thread.join();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void TerminalApp::shutdown() {
  {
    std::lock_guard<std::mutex> lock(m_stop_mutex);
    if (m_stopping && m_tasks.empty())
      return;
    m_stopping = true;
  }
  m_stop_cv.notify_all();

  for (auto &task : m_tasks) {
    if (task.valid())
      task.wait();
  }
  m_tasks.clear();
}

/**
 * @brief Starts the UI event loop
 *
 * Wraps the controller's renderer with an event handler that forwards every
 * key to the controller. Mouse input and the animation tick are left to
 * FTXUI. Blocks until the user quits, then cancels the remaining
 * background work and saves the configuration.
 */
int TerminalApp::run() {
  auto document = Renderer([this] { return m_controller.render(); });
  auto root = CatchEvent(document, [this](Event event) {
    if (event.is_mouse() || event == Event::Custom)
      return false;
    handle(KeyPressed{event});
    return true;
  });

  spdlog::info("starting user interface");
  dispatch(m_controller.start());
  startAnimation();

  m_screen.Loop(root);

  stopAnimation();
  shutdown();
  spdlog::info("user interface closed");

  Status saved = m_controller.shutdown();
  return saved ? 0 : 1;
}
