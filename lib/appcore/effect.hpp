/**
 * @file effect.hpp
 * @brief Deferred work returned by AppController::update()
 *
 * An Effect is a closure that produces exactly one Message. The controller
 * never runs effects itself: the terminal front end runs them on worker
 * threads and posts the resulting message back to the UI thread, tests run
 * them synchronously. Effects capture copies of what they need (ids, names,
 * shared client handles) and never references into application state.
 */

#ifndef EFFECT_HPP
#define EFFECT_HPP

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "message.hpp"

enum class EffectKind {
  Immediate, ///< produces a ready message, dispatched in order on the UI thread
  Fetch,     ///< lists children of a tree node
  Upload,
  Probe,     ///< one health probe
  Timer,     ///< periodic health refresh
  Load,      ///< loads remote state for a dialog
  Submit,    ///< applies a confirmed dialog remotely
  Download,
  Persist,   ///< writes the configuration file
  Animation  ///< overlay transition frame
};

/**
 * @class EffectContext
 * @brief Services an effect may use while it runs
 */
class EffectContext {
public:
  virtual ~EffectContext() = default;

  /**
   * @brief Waits for @p duration
   * @return false if the wait was interrupted because the application is
   *         shutting down
   */
  virtual bool sleepFor(std::chrono::milliseconds duration) = 0;
};

struct Effect {
  EffectKind kind = EffectKind::Immediate;
  std::string label;
  std::function<Message(EffectContext &)> run;
  /** @brief Turns an exception thrown by run into a message */
  std::function<Message(const std::string &)> onException;
};

/** @brief Effect that just delivers @p message */
Effect immediate(Message message);

Effect makeEffect(EffectKind kind, std::string label,
                  std::function<Message(EffectContext &)> run,
                  std::function<Message(const std::string &)> on_exception = {});

/**
 * @brief Runs @p effect, converting exceptions into its failure message
 *
 * Without an onException handler the failure becomes EffectFailed.
 */
Message runEffect(const Effect &effect, EffectContext &context);

/** @brief Appends @p more to @p effects */
inline void append(std::vector<Effect> &effects, std::vector<Effect> more) {
  for (auto &effect : more)
    effects.push_back(std::move(effect));
}

#endif // EFFECT_HPP
