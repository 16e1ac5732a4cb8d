/**
 * @file terminalapp.hpp
 * @brief Full-screen FTXUI front end driving the AppController
 *
 * TerminalApp owns the FTXUI screen and the effect runner. Every key press
 * becomes a KeyPressed message; the controller turns messages into effects
 * which are executed here:
 * - Immediate effects run in order on the UI thread
 * - Everything else runs on a worker thread via std::async and posts its
 *   resulting message back with ScreenInteractive::Post()
 *
 * The controller and its state are only ever touched from the UI thread.
 *
 * @see AppController
 * @see Effect
 */

#ifndef TERMINALAPP_HPP
#define TERMINALAPP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>

#include "controller.hpp"

using namespace ftxui;

/**
 * @class TerminalApp
 * @brief Event loop host: input, rendering and background effects
 *
 * Architecture:
 * - Messages are queued and processed one at a time so an effect produced
 *   while handling a message never re-enters AppController::update()
 * - Background effects wait through an interruptible context; shutdown()
 *   wakes every sleeping timer and probe, then joins the workers
 * - An animation thread posts a custom event every 100 ms so spinners and
 *   the dashboard clock keep moving without input
 */
class TerminalApp {
private:
  /**
   * @class WorkerContext
   * @brief EffectContext whose sleeps end early on shutdown
   */
  class WorkerContext : public EffectContext {
  private:
    TerminalApp &m_app;

  public:
    explicit WorkerContext(TerminalApp &app) : m_app(app) {}
    bool sleepFor(std::chrono::milliseconds duration) override;
  };

  AppController m_controller;
  WorkerContext m_context{*this};

  /** @brief FTXUI fullscreen terminal screen instance */
  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();

  // ===== Message processing (UI thread only) =====

  std::deque<Message> m_queue;
  bool m_processing = false;

  // ===== Background effects =====

  std::vector<std::future<void>> m_tasks;
  std::mutex m_stop_mutex;
  std::condition_variable m_stop_cv;
  bool m_stopping = false;

  // ===== Animation =====

  std::atomic<bool> m_animating{false};
  std::thread m_animation_thread;

  /** @brief Queues @p message and drains the queue unless already draining */
  void handle(Message message);

  /** @brief Processes queued messages until the queue is empty */
  void drain();

  /** @brief Runs or schedules each effect */
  void dispatch(std::vector<Effect> effects);

  /** @brief Starts @p effect on a worker thread */
  void spawn(Effect effect);

  /** @brief Drops futures of finished workers */
  void pruneTasks();

  bool stopping();

  void startAnimation();
  void stopAnimation();

  /** @brief Cancels sleeping workers and waits for all of them */
  void shutdown();

public:
  explicit TerminalApp(World world);
  ~TerminalApp();

  TerminalApp(const TerminalApp &) = delete;
  TerminalApp &operator=(const TerminalApp &) = delete;

  /**
   * @brief Runs the UI until the user quits
   * @return Process exit code; 1 if the configuration could not be saved
   */
  int run();
};

#endif // TERMINALAPP_HPP
